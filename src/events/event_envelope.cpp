#include "events/event_envelope.h"
#include "core/errors.h"
#include "events/topic_router.h"
#include "utils/uuid_utils.h"

using json = nlohmann::json;

namespace {
std::string requireEnvelopeString(const json &doc, const char *key) {
  if (!doc.contains(key) || !doc[key].is_string())
    throw EnvelopeDecodeError(std::string("envelope field '") + key +
                              "' missing or not a string");
  std::string value = doc[key].get<std::string>();
  if (value.empty())
    throw EnvelopeDecodeError(std::string("envelope field '") + key +
                              "' is empty");
  return value;
}
} // namespace

EventEnvelope::EventEnvelope(std::string eventType,
                             std::optional<std::string> eventId,
                             std::string entityId,
                             TimeUtils::OptionalTimestamp timestamp,
                             json data)
    : eventType_(std::move(eventType)), eventId_(std::move(eventId)),
      entityId_(std::move(entityId)), timestamp_(timestamp),
      data_(data.is_null() ? json::object() : std::move(data)) {}

EventEnvelope EventEnvelope::decode(const std::string &raw) {
  json doc;
  try {
    doc = json::parse(raw);
  } catch (const json::parse_error &e) {
    throw EnvelopeDecodeError(std::string("invalid JSON: ") + e.what());
  }

  if (!doc.is_object())
    throw EnvelopeDecodeError("envelope is not a JSON object");

  std::string eventType = requireEnvelopeString(doc, "event_type");

  // entity_id is the partition key; producers may render numeric ids as
  // numbers.
  std::string entityId;
  if (doc.contains("entity_id") && doc["entity_id"].is_number_integer())
    entityId = std::to_string(doc["entity_id"].get<long long>());
  else
    entityId = requireEnvelopeString(doc, "entity_id");

  std::optional<std::string> eventId;
  if (doc.contains("event_id") && doc["event_id"].is_string() &&
      !doc["event_id"].get<std::string>().empty())
    eventId = doc["event_id"].get<std::string>();

  TimeUtils::OptionalTimestamp timestamp;
  if (doc.contains("timestamp") && doc["timestamp"].is_string()) {
    try {
      timestamp = TimeUtils::parseOptionalIsoTimestamp(
          doc["timestamp"].get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw EnvelopeDecodeError(e.what());
    }
  }

  json data = json::object();
  if (doc.contains("data") && !doc["data"].is_null()) {
    if (!doc["data"].is_object())
      throw EnvelopeDecodeError("envelope field 'data' is not an object");
    data = doc["data"];
  }

  return EventEnvelope(std::move(eventType), std::move(eventId),
                       std::move(entityId), timestamp, std::move(data));
}

EventEnvelope EventEnvelope::create(EventKind kind, const std::string &entityId,
                                    json data) {
  return EventEnvelope(TopicRouter::eventTypeName(kind),
                       UuidUtils::generateV4(), entityId, TimeUtils::nowUtc(),
                       std::move(data));
}

std::string EventEnvelope::encode() const {
  json doc;
  doc["event_type"] = eventType_;
  doc["event_id"] = eventId_ ? json(*eventId_) : json(nullptr);
  doc["entity_id"] = entityId_;
  doc["timestamp"] =
      timestamp_ ? json(TimeUtils::formatIsoUtc(*timestamp_)) : json(nullptr);
  doc["data"] = data_;
  return doc.dump();
}

std::optional<EventKind> EventEnvelope::kind() const {
  return TopicRouter::parseEventType(eventType_);
}

std::string EventEnvelope::describe() const {
  return eventType_ + " entity=" + entityId_ +
         " event_id=" + eventId_.value_or("<none>");
}
