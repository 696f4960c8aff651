#pragma once

#include <memory>

namespace scavenger::core {
class ParticipantDirectory;
class ValueTransfer;
class RewardSplitSource;
} // namespace scavenger::core
namespace scavenger::db { class Repository; }
namespace scavenger::observability { class EventSink; }

namespace scavenger::core {

/*
  Dependency container shared by all engine components.
*/
struct EngineContext {
  std::shared_ptr<scavenger::db::Repository> repository;
  std::shared_ptr<ParticipantDirectory> directory;
  std::shared_ptr<ValueTransfer> payments;
  std::shared_ptr<RewardSplitSource> split;
  std::shared_ptr<scavenger::observability::EventSink> events;
};

}
