#include "memory_tx.hpp"

#include <stdexcept>

namespace scavenger::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

void MemoryTransaction::Commit() {
  if (state_ != TxState::kOpen) {
    throw std::logic_error("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    state_ = TxState::kRolledBack;
    throw std::runtime_error("memory transaction conflict: ledger state changed since Begin()");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  state_ = TxState::kCommitted;
}

void MemoryTransaction::Rollback() {
  if (state_ == TxState::kOpen) {
    state_ = TxState::kRolledBack;
  }
}

} // namespace scavenger::db::memory
