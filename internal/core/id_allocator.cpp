#include "id_allocator.hpp"

#include "internal/core/record_access.hpp"
#include "internal/util/checked_math.hpp"

namespace scavenger::core {

IdAllocator::IdAllocator(std::shared_ptr<scavenger::db::Repository> repository) : repository_(std::move(repository)) {
}

std::string IdAllocator::CounterName(IdSpace space) {
  switch (space) {
    case IdSpace::kWaste:
      return "waste";
    case IdSpace::kIncentive:
      return "incentive";
    case IdSpace::kTransfer:
      return "transfer";
  }
  return "unknown";
}

uint64_t IdAllocator::Next(scavenger::db::Transaction& tx, IdSpace space) {
  const auto name = CounterName(space);
  const auto next = scavenger::util::CheckedAdd(repository_->GetCounter(tx, name), 1, name + " id");
  ThrowIfDbError(repository_->SetCounter(tx, name, next), "allocate " + name + " id");
  return next;
}

uint64_t IdAllocator::Current(scavenger::db::Transaction& tx, IdSpace space) const {
  return repository_->GetCounter(tx, CounterName(space));
}

} // namespace scavenger::core
