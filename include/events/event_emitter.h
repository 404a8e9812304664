#ifndef EVENT_EMITTER_H
#define EVENT_EMITTER_H

#include "events/event_envelope.h"
#include "events/event_publisher.h"
#include <atomic>
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

struct PersistedEntity {
  std::string entityId;
  nlohmann::json data;
};

// Producer-side emission discipline. An event is announced only after the
// write it describes has committed in the source store; the entity id is
// the partition key, so all events of one entity share a partition.
class EventEmitter {
public:
  explicit EventEmitter(IEventPublisher &publisher) : publisher_(publisher) {}

  // Builds an envelope and publishes it to the kind's topic. Publisher
  // failures propagate.
  EventEnvelope emit(EventKind kind, const std::string &entityId,
                     nlohmann::json data);

  // Runs the write, then emits. If the write throws nothing is emitted and
  // the exception propagates. If the emission fails after the write
  // committed, the failure is logged and false is returned; the write is
  // not undone.
  bool persistThenEmit(EventKind kind,
                       const std::function<PersistedEntity()> &persist);

  int flush(int timeoutMs = 10000);

  size_t emittedCount() const { return emitted_.load(); }
  size_t failedEmitCount() const { return failedEmits_.load(); }

private:
  IEventPublisher &publisher_;
  std::atomic<size_t> emitted_{0};
  std::atomic<size_t> failedEmits_{0};
};

#endif
