#pragma once

#include <cstddef>
#include <string>

namespace ragkb_core {

// Keeps at most max_code_points Unicode code points of a valid UTF-8 string.
std::string truncate_code_points(const std::string &text, size_t max_code_points);

size_t count_code_points(const std::string &text);

// Replaces invalid UTF-8 sequences with U+FFFD. Returns true if anything changed.
bool sanitize_utf8(std::string &text);

}  // namespace ragkb_core
