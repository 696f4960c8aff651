#pragma once

namespace scavenger::db {

enum class TxState { kOpen, kCommitted, kRolledBack };

/*
  Unit of work for one ledger call.

  Every engine operation reads, validates and writes inside a single
  Transaction and commits once at the end. Nothing it wrote is visible to
  other transactions before Commit(). Destroying an open transaction rolls
  it back, so an exception thrown mid-operation leaves no partial writes.

  Commit() on a finished transaction throws std::logic_error.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual TxState State() const = 0;

  bool IsOpen() const {
    return State() == TxState::kOpen;
  }
};

} // namespace scavenger::db
