#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace scavenger::db::sqlite {

// BEGIN IMMEDIATE takes the write lock up front, so a second writer fails at
// Begin() (SQLITE_BUSY after busy_timeout) rather than halfway through a call.
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

  TxState State() const override {
    return state_;
  }

 private:
  std::shared_ptr<SqliteDB> db_;
  TxState                   state_ = TxState::kOpen;
};

} // namespace scavenger::db::sqlite
