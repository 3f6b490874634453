#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>
#include <string>

namespace ragkb_core {

// Write transaction over one container. Takes the write lock up front and rolls
// back on scope exit unless commit() was called.
class Transaction {
 public:
  Transaction(sqlite::database& db, std::string operation)
      : db_(db), operation_(std::move(operation)) {
    db_ << "BEGIN IMMEDIATE;";
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!open_) {
      return;
    }
    db_ << "COMMIT;";
    open_ = false;
  }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    std::cerr << "Rolling back " << operation_ << std::endl;
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "Rollback of " << operation_ << " failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  std::string operation_;
  bool open_ = false;
};

}  // namespace ragkb_core
