#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"

namespace scavenger::observability {

/*
  Outbound notification emitted after a mutation commits.

  topic:      "waste.submitted", "rewards.settled", ...
  subject_id: id of the waste unit or incentive the event is about
*/
struct Event {
  std::string           topic;
  uint64_t              subject_id = 0;
  std::vector<LogField> attributes;
};

/*
  Fire-and-forget sink. Implementations may throw; the engine logs the
  failure and carries on, the call outcome never depends on delivery.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const Event& event) = 0;
};

// Writes one structured log line per event.
class LoggingEventSink final : public EventSink {
 public:
  void Publish(const Event& event) override;
};

// Delivers to a sink, logging instead of propagating sink failures.
void PublishBestEffort(EventSink* sink, const Event& event);

} // namespace scavenger::observability
