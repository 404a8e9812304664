#ifndef IDOMAIN_CONSUMER_H
#define IDOMAIN_CONSUMER_H

#include "dal/row_types.h"
#include "events/event_envelope.h"
#include "events/event_kind.h"
#include "events/topic_router.h"
#include "utils/json_utils.h"
#include <functional>
#include <map>

using EventHandler = std::function<void(const EventEnvelope &)>;

// One implementation per domain. Handlers throw on anything that should not
// be committed (missing required field, database failure); returning
// normally means the event has been applied.
class IDomainConsumer {
public:
  virtual ~IDomainConsumer() = default;

  virtual Domain getDomain() const = 0;
  virtual std::map<EventKind, EventHandler> getHandlers() = 0;
};

inline EventBookkeeping bookkeepingOf(const EventEnvelope &event) {
  return EventBookkeeping{event.eventId(), event.timestamp()};
}

// Minimal delete payloads name the entity in "<domain>_id"; older producers
// only set the envelope entity id.
inline std::string deletedEntityId(const EventEnvelope &event, Domain domain) {
  const std::string field = TopicRouter::idFieldOf(domain);
  auto fromPayload = JsonUtils::string(event.data(), field.c_str());
  if (fromPayload && !fromPayload->empty())
    return *fromPayload;
  return event.entityId();
}

#endif
