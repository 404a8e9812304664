#include "sync/EventDispatcher.h"
#include "core/consumer_config.h"
#include "core/errors.h"
#include "core/logger.h"
#include "events/event_envelope.h"
#include "events/topic_router.h"
#include <algorithm>
#include <chrono>
#include <optional>
#include <thread>

EventDispatcher::EventDispatcher(IMessageSource &source,
                                 const HandlerRegistry &registry)
    : source_(source), registry_(registry) {}

std::string EventDispatcher::stateName(DispatcherState state) {
  switch (state) {
  case DispatcherState::IDLE:
    return "IDLE";
  case DispatcherState::POLLING:
    return "POLLING";
  case DispatcherState::DISPATCHING:
    return "DISPATCHING";
  case DispatcherState::SHUTTING_DOWN:
    return "SHUTTING_DOWN";
  }
  return "UNKNOWN";
}

void EventDispatcher::start() {
  if (state_ != DispatcherState::IDLE) {
    Logger::warning(LogCategory::DISPATCH, "EventDispatcher",
                    "start() called in state " + stateName(state_));
    return;
  }

  auto topics = registry_.topics();
  if (topics.empty()) {
    throw std::logic_error("No consumers registered; nothing to subscribe");
  }
  source_.subscribe(topics);
  state_ = DispatcherState::POLLING;

  std::string joined;
  for (const auto &topic : topics)
    joined += (joined.empty() ? "" : ", ") + topic;
  Logger::info(LogCategory::DISPATCH, "EventDispatcher",
               "Subscribed to " + joined);
}

std::string EventDispatcher::partitionKey(const KafkaMessage &message) {
  return message.topic + "[" + std::to_string(message.partition) + "]";
}

size_t EventDispatcher::pollOnce(const ShutdownCheck &shutdownCheck) {
  if (state_ == DispatcherState::IDLE)
    start();
  if (state_ == DispatcherState::SHUTTING_DOWN)
    return 0;

  auto batch = source_.poll(ConsumerConfig::getMaxBatchSize(),
                            static_cast<int>(ConsumerConfig::getPollTimeoutMs()));
  if (batch.empty())
    return 0;

  size_t committed = 0;
  bool anyFailure = false;
  std::set<std::string> rewound;

  state_ = DispatcherState::DISPATCHING;
  for (const auto &message : batch) {
    if (shutdownCheck && shutdownCheck()) {
      Logger::info(LogCategory::DISPATCH, "EventDispatcher",
                   "Shutdown requested; leaving " + message.position() +
                       " and the rest of the batch uncommitted");
      break;
    }

    const std::string key = partitionKey(message);
    if (rewound.count(key))
      continue;

    if (dispatch(message)) {
      ++committed;
    } else {
      rewound.insert(key);
      anyFailure = true;
    }
  }
  state_ = DispatcherState::POLLING;

  if (anyFailure)
    backoff(shutdownCheck);
  return committed;
}

bool EventDispatcher::dispatch(const KafkaMessage &message) {
  std::optional<EventEnvelope> envelope;
  try {
    envelope = EventEnvelope::decode(message.value);
  } catch (const EnvelopeDecodeError &e) {
    skip(message, std::string("undecodable envelope: ") + e.what());
    return true;
  }

  auto kind = envelope->kind();
  if (!kind) {
    skip(message, "unknown event type " + envelope->eventType());
    return true;
  }
  if (!TopicRouter::belongsToTopic(*kind, message.topic)) {
    skip(message, envelope->eventType() + " does not belong on topic " +
                      message.topic);
    return true;
  }

  const EventHandler *handler = registry_.find(message.topic, *kind);
  if (!handler) {
    skip(message, "no handler registered for " + envelope->eventType());
    return true;
  }

  try {
    (*handler)(*envelope);
  } catch (const std::exception &e) {
    return handleFailure(message, envelope->describe(), e.what());
  }

  failures_.erase(partitionKey(message));
  ++processed_;
  commit(message);
  return true;
}

bool EventDispatcher::handleFailure(const KafkaMessage &message,
                                    const std::string &context,
                                    const std::string &error) {
  FailureRecord &record = failures_[partitionKey(message)];
  if (record.offset != message.offset) {
    record.offset = message.offset;
    record.attempts = 0;
  }
  ++record.attempts;
  ++failed_;

  Logger::error(LogCategory::DISPATCH, "EventDispatcher",
                "Handler failed for " + context + " at " + message.position() +
                    " (attempt " + std::to_string(record.attempts) +
                    "): " + error);

  size_t limit = ConsumerConfig::getMaxHandlerRetries();
  if (limit > 0 && record.attempts >= limit) {
    Logger::critical(LogCategory::DISPATCH, "EventDispatcher",
                     "Parking " + message.position() + " after " +
                         std::to_string(record.attempts) +
                         " failed attempts; payload: " + message.value);
    failures_.erase(partitionKey(message));
    ++parked_;
    commit(message);
    return true;
  }

  try {
    source_.seek(message.topic, message.partition, message.offset);
  } catch (const KafkaError &e) {
    Logger::error(LogCategory::KAFKA, "EventDispatcher",
                  "Seek back to " + message.position() +
                      " failed, redelivery relies on rebalance: " + e.what());
  }
  return false;
}

void EventDispatcher::skip(const KafkaMessage &message,
                           const std::string &reason) {
  Logger::warning(LogCategory::DISPATCH, "EventDispatcher",
                  "Skipping " + message.position() + ": " + reason);
  ++skipped_;
  commit(message);
}

void EventDispatcher::commit(const KafkaMessage &message) {
  try {
    source_.commit(message);
  } catch (const KafkaError &e) {
    Logger::error(LogCategory::KAFKA, "EventDispatcher",
                  "Commit of " + message.position() +
                      " failed, message may be redelivered: " + e.what());
  }
}

void EventDispatcher::backoff(const ShutdownCheck &shutdownCheck) {
  using namespace std::chrono;
  const auto deadline =
      steady_clock::now() + milliseconds(ConsumerConfig::getRetryBackoffMs());
  while (steady_clock::now() < deadline) {
    if (shutdownCheck && shutdownCheck())
      return;
    std::this_thread::sleep_for(
        std::min<steady_clock::duration>(milliseconds(100),
                                         deadline - steady_clock::now()));
  }
}

void EventDispatcher::run(const ShutdownCheck &shutdownCheck) {
  if (state_ == DispatcherState::IDLE)
    start();

  Logger::info(LogCategory::DISPATCH, "EventDispatcher", "Dispatch loop started");
  while (!shutdownCheck()) {
    pollOnce(shutdownCheck);
  }
  stop();
}

void EventDispatcher::stop() {
  if (state_ == DispatcherState::SHUTTING_DOWN)
    return;
  state_ = DispatcherState::SHUTTING_DOWN;
  source_.close();

  auto stats = getStats();
  Logger::info(LogCategory::DISPATCH, "EventDispatcher",
               "Stopped. processed=" + std::to_string(stats.processed) +
                   " skipped=" + std::to_string(stats.skipped) +
                   " failed=" + std::to_string(stats.failed) +
                   " parked=" + std::to_string(stats.parked));
}

DispatchStats EventDispatcher::getStats() const {
  DispatchStats stats;
  stats.processed = processed_;
  stats.skipped = skipped_;
  stats.failed = failed_;
  stats.parked = parked_;
  return stats;
}
