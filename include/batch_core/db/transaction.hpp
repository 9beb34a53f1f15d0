#pragma once

#include <iostream>
#include <string>
#include <utility>

#include <sqlite_modern_cpp.h>

namespace batch_core {

enum class TransactionMode {
  Deferred,
  // Takes the write lock up front, so a busy database fails at BEGIN
  // instead of halfway through a multi-row write
  Immediate
};

/**
 * @brief Scoped transaction on a borrowed connection.
 *
 * Rolls back on scope exit unless commit() was reached. The label names the
 * store operation in the rollback diagnostics.
 */
class Transaction {
 public:
  Transaction(sqlite::database& db, std::string label,
              TransactionMode mode = TransactionMode::Immediate)
      : db_(db), label_(std::move(label)) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
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

  bool is_open() const { return open_; }

  ~Transaction() noexcept {
    if (!open_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      std::cerr << "[Transaction] Rollback of " << label_ << " failed: " << e.what()
                << std::endl;
    }
  }

 private:
  sqlite::database& db_;
  std::string label_;
  bool open_ = false;
};

}  // namespace batch_core
