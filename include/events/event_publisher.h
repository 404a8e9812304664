#ifndef EVENT_PUBLISHER_H
#define EVENT_PUBLISHER_H

#include <string>

// Outbound side of the broker. publish() enqueues one message and throws
// KafkaError when the client refuses it; delivery itself is asynchronous.
class IEventPublisher {
public:
  virtual ~IEventPublisher() = default;

  virtual void publish(const std::string &topic, const std::string &key,
                       const std::string &value) = 0;

  // Waits up to timeoutMs for queued messages; returns how many are still
  // undelivered (0 means everything was acknowledged).
  virtual int flush(int timeoutMs) = 0;
};

#endif
