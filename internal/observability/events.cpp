#include "internal/observability/events.hpp"

#include <exception>

namespace scavenger::observability {

void LoggingEventSink::Publish(const Event& event) {
  std::vector<LogField> fields;
  fields.reserve(event.attributes.size() + 2);
  fields.push_back(StringField("topic", event.topic));
  fields.push_back(UintField("subject_id", event.subject_id));
  fields.insert(fields.end(), event.attributes.begin(), event.attributes.end());
  Log(spdlog::level::info, "event", fields);
}

void PublishBestEffort(EventSink* sink, const Event& event) {
  if (!sink) {
    return;
  }
  try {
    sink->Publish(event);
  } catch (const std::exception& ex) {
    SCAVENGER_LOG_WARN("event delivery failed", {StringField("topic", event.topic), UintField("subject_id", event.subject_id),
                                                 StringField("error", ex.what())});
  }
}

} // namespace scavenger::observability
