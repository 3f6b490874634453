#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. ragkb_core/types/chunk.hpp),
// users can simply do `#include "ragkb_core/types.hpp"`.
//
#include "ragkb_core/types/chunk.hpp"
#include "ragkb_core/types/document.hpp"
#include "ragkb_core/types/file.hpp"
#include "ragkb_core/types/search_result.hpp"
