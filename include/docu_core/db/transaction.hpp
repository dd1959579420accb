#pragma once

#include <spdlog/spdlog.h>
#include <sqlite_modern_cpp.h>

namespace docu_core {

enum class TransactionMode {
  Deferred,
  // Takes the write lock up front so a batch of inserts cannot fail half way on SQLITE_BUSY
  Immediate
};

// Scoped SQL transaction on a borrowed connection. Rolls back on destruction unless committed.
class Transaction {
 public:
  explicit Transaction(sqlite::database& db, TransactionMode mode = TransactionMode::Deferred)
      : db_(db) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  }

  ~Transaction() noexcept {
    if (committed_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception& e) {
      spdlog::error("Transaction rollback failed: {}", e.what());
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!committed_) {
      db_ << "COMMIT;";
      committed_ = true;
    }
  }

  bool committed() const {
    return committed_;
  }

 private:
  sqlite::database& db_;
  bool committed_ = false;
};

}  // namespace docu_core
