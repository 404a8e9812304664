#ifndef EVENT_ENVELOPE_H
#define EVENT_ENVELOPE_H

#include "events/event_kind.h"
#include "utils/time_utils.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Wire envelope shared by every topic:
//   {"event_type", "event_id", "entity_id", "timestamp", "data"}
// Instances are immutable once built or decoded.
class EventEnvelope {
public:
  // Throws EnvelopeDecodeError when the bytes are not a JSON object, when
  // event_type or entity_id is missing or not a string, or when a present
  // timestamp cannot be parsed. A missing data object reads as {}.
  static EventEnvelope decode(const std::string &raw);

  // Fresh envelope for an outgoing event: new UUID v4, current UTC time.
  static EventEnvelope create(EventKind kind, const std::string &entityId,
                              nlohmann::json data);

  EventEnvelope(std::string eventType, std::optional<std::string> eventId,
                std::string entityId, TimeUtils::OptionalTimestamp timestamp,
                nlohmann::json data);

  std::string encode() const;

  const std::string &eventType() const { return eventType_; }
  const std::optional<std::string> &eventId() const { return eventId_; }
  const std::string &entityId() const { return entityId_; }
  const TimeUtils::OptionalTimestamp &timestamp() const { return timestamp_; }
  const nlohmann::json &data() const { return data_; }

  // nullopt for event types outside the known set.
  std::optional<EventKind> kind() const;

  std::string describe() const;

private:
  std::string eventType_;
  std::optional<std::string> eventId_;
  std::string entityId_;
  TimeUtils::OptionalTimestamp timestamp_;
  nlohmann::json data_;
};

#endif
