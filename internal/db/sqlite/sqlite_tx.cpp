#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace scavenger::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != TxState::kOpen) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& ex) {
    SCAVENGER_LOG_ERROR("sqlite rollback on unwind failed", {observability::StringField("error", ex.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != TxState::kOpen) {
    throw std::logic_error("sqlite transaction already finished");
  }
  db_->Exec("COMMIT;");
  state_ = TxState::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != TxState::kOpen) return;
  // a failed ROLLBACK still ends the transaction from the caller's view
  state_ = TxState::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace scavenger::db::sqlite
