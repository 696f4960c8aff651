#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace scavenger::db::memory {

/*
  Optimistic transaction over MemoryRepository.

  Works on a private copy of the committed state taken at Begin(). Commit()
  publishes the copy only if no other transaction committed in between;
  otherwise it throws and the copy is dropped.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;

  TxState State() const override {
    return state_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                base_version_ = 0;
  TxState                 state_        = TxState::kOpen;
};

} // namespace scavenger::db::memory
