#pragma once

#include <sqlite_modern_cpp.h>

namespace docvec_core {

/**
 * Scoped write transaction. Rolls back on destruction unless commit() ran,
 * so an exception anywhere in a batch leaves no partial rows behind.
 */
class Transaction {
 public:
  enum class Locking {
    Deferred,
    // Takes the write lock up front so a batch never fails halfway on SQLITE_BUSY
    Immediate
  };

  explicit Transaction(sqlite::database& db, Locking locking = Locking::Deferred) : db_(db) {
    db_ << (locking == Locking::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
    active_ = true;
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit() {
    if (!active_)
      return;
    db_ << "COMMIT;";
    active_ = false;
  }

  ~Transaction() noexcept {
    if (!active_)
      return;
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception&) {
      // SQLite already rolled the transaction back on the failing statement
    }
  }

 private:
  sqlite::database& db_;
  bool active_ = false;
};

}  // namespace docvec_core
