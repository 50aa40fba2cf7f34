#pragma once

#include <iostream>

#include <sqlite_modern_cpp.h>

namespace docrag_core {

enum class TxMode { Deferred, Immediate };

// Scoped write batch on one leased handle. Anything not committed is rolled back.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TxMode mode = TxMode::Deferred) : db_(db) {
    db_ << (mode == TxMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    open_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  ~Transaction() {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "[Transaction] ROLLBACK failed: " << e.errstr() << std::endl;
    }
  }

  void commit() {
    if (open_) {
      db_ << "COMMIT;";
      open_ = false;
    }
  }

  bool is_open() const { return open_; }

 private:
  sqlite::database& db_;
  bool open_ = false;
};

}  // namespace docrag_core
