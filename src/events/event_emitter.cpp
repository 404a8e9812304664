#include "events/event_emitter.h"
#include "core/logger.h"
#include "events/topic_router.h"

EventEnvelope EventEmitter::emit(EventKind kind, const std::string &entityId,
                                 nlohmann::json data) {
  EventEnvelope envelope = EventEnvelope::create(kind, entityId, std::move(data));
  const std::string topic = TopicRouter::topicFor(kind);

  publisher_.publish(topic, entityId, envelope.encode());
  emitted_++;

  Logger::debug(LogCategory::PRODUCER, "EventEmitter",
                "Queued " + envelope.describe() + " on topic " + topic);
  return envelope;
}

bool EventEmitter::persistThenEmit(
    EventKind kind, const std::function<PersistedEntity()> &persist) {
  PersistedEntity entity = persist();

  try {
    emit(kind, entity.entityId, std::move(entity.data));
    return true;
  } catch (const std::exception &e) {
    failedEmits_++;
    Logger::error(LogCategory::PRODUCER, "EventEmitter",
                  "Write for " + TopicRouter::eventTypeName(kind) + " " +
                      entity.entityId +
                      " committed but the event could not be emitted; the "
                      "replica will miss it: " +
                      std::string(e.what()));
    return false;
  }
}

int EventEmitter::flush(int timeoutMs) {
  int remaining = publisher_.flush(timeoutMs);
  if (remaining > 0) {
    Logger::warning(LogCategory::PRODUCER, "EventEmitter",
                    std::to_string(remaining) +
                        " event(s) still undelivered after flush");
  }
  return remaining;
}
