#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <string>

#include "ragkb_core/errors.hpp"

namespace ragkb_core {

// Short label for a primary SQLite result code, used in StorageError messages
inline const char* sqlite_failure_label(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return "busy_or_locked";
    case SQLITE_CONSTRAINT:
      return "constraint";
    case SQLITE_READONLY:
      return "readonly";
    case SQLITE_IOERR:
      return "io";
    case SQLITE_CANTOPEN:
      return "cantopen";
    case SQLITE_FULL:
      return "full";
    // A file that is not an index container at all lands here
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return "corrupt";
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return "schema";
    default:
      return "generic";
  }
}

// "<operation> failed: (<label>) <sqlite message> [code=..., xcode=...]"
inline StorageError to_storage_error(const std::string& operation,
                                     const sqlite::sqlite_exception& e) {
  const int code = e.get_code();
  return StorageError(operation + " failed: (" + sqlite_failure_label(code) + ") " + e.what() +
                      " [code=" + std::to_string(code) +
                      ", xcode=" + std::to_string(e.get_extended_code()) + "]");
}

}  // namespace ragkb_core
