#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace scavenger::core {

enum class IdSpace {
  kWaste,
  kIncentive,
  kTransfer,
};

/*
  Monotonic ids, one counter per space, starting at 1.

  The counter is advanced inside the caller's transaction; if that
  transaction never commits the id is handed out again.
*/
class IdAllocator {
 public:
  explicit IdAllocator(std::shared_ptr<scavenger::db::Repository> repository);

  uint64_t Next(scavenger::db::Transaction& tx, IdSpace space);

  // Highest id handed out so far, 0 when none.
  uint64_t Current(scavenger::db::Transaction& tx, IdSpace space) const;

  static std::string CounterName(IdSpace space);

 private:
  std::shared_ptr<scavenger::db::Repository> repository_;
};

} // namespace scavenger::core
