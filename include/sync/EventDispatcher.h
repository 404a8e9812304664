#ifndef EVENT_DISPATCHER_H
#define EVENT_DISPATCHER_H

#include "sync/HandlerRegistry.h"
#include "sync/MessageSource.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <set>
#include <string>

enum class DispatcherState { IDLE, POLLING, DISPATCHING, SHUTTING_DOWN };

struct DispatchStats {
  size_t processed = 0;
  size_t skipped = 0;
  size_t failed = 0;
  size_t parked = 0;
};

// Sequential poll -> decode -> route -> handle -> commit loop.
//
// A message's offset is committed once its handler returned, or once it has
// been judged unprocessable (bad envelope, unknown kind, wrong topic, no
// handler). A handler exception leaves the offset uncommitted and rewinds
// the partition, so the same message comes back on the next poll; later
// messages of that partition in the current batch are not dispatched. With
// ConsumerConfig::MAX_HANDLER_RETRIES > 0 a message that keeps failing is
// parked (logged at CRITICAL, then committed past).
class EventDispatcher {
public:
  using ShutdownCheck = std::function<bool()>;

  EventDispatcher(IMessageSource &source, const HandlerRegistry &registry);

  // Subscribes to every registered topic. IDLE -> POLLING.
  void start();

  // One batch. The check runs before each message; once it reports true the
  // rest of the batch is left uncommitted. Returns the number of messages
  // whose offset was committed.
  size_t pollOnce(const ShutdownCheck &shutdownCheck = ShutdownCheck());

  // Loops pollOnce() until the check reports true, then closes the source.
  void run(const ShutdownCheck &shutdownCheck);

  void stop();

  DispatcherState getState() const { return state_.load(); }
  DispatchStats getStats() const;

  static std::string stateName(DispatcherState state);

private:
  struct FailureRecord {
    int64_t offset = -1;
    size_t attempts = 0;
  };

  // true when the message offset was committed.
  bool dispatch(const KafkaMessage &message);
  bool handleFailure(const KafkaMessage &message, const std::string &context,
                     const std::string &error);
  void skip(const KafkaMessage &message, const std::string &reason);
  void commit(const KafkaMessage &message);
  void backoff(const ShutdownCheck &shutdownCheck);

  static std::string partitionKey(const KafkaMessage &message);

  IMessageSource &source_;
  const HandlerRegistry &registry_;
  std::atomic<DispatcherState> state_{DispatcherState::IDLE};

  std::atomic<size_t> processed_{0};
  std::atomic<size_t> skipped_{0};
  std::atomic<size_t> failed_{0};
  std::atomic<size_t> parked_{0};

  std::map<std::string, FailureRecord> failures_;
};

#endif
