#ifndef KAFKA_ENGINE_H
#define KAFKA_ENGINE_H

#include "events/event_publisher.h"
#include "sync/MessageSource.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

typedef struct rd_kafka_s rd_kafka_t;
typedef struct rd_kafka_message_s rd_kafka_message_t;

// librdkafka wrapper used both as the dispatcher's message source (manual
// offset commits, seek for redelivery) and as the producer behind
// EventEmitter. The consumer and producer handles are created lazily by
// initializeConsumer() / initializeProducer().
class KafkaEngine : public IMessageSource, public IEventPublisher {
public:
  struct KafkaConfig {
    std::string brokers;
    std::string clientId{"eventsync"};
    std::string groupId;
    std::string autoOffsetReset{"earliest"};
    int sessionTimeoutMs{45000};
    std::map<std::string, std::string> kafkaConf;
  };

  struct KafkaStats {
    int64_t messagesProduced{0};
    int64_t messagesConsumed{0};
    int64_t deliveryFailures{0};
    int64_t errors{0};
  };

  explicit KafkaEngine(const KafkaConfig &config);
  ~KafkaEngine() override;

  KafkaEngine(const KafkaEngine &) = delete;
  KafkaEngine &operator=(const KafkaEngine &) = delete;

  // Both throw KafkaError when the client cannot be created.
  void initializeConsumer();
  void initializeProducer();

  void subscribe(const std::vector<std::string> &topics) override;
  std::vector<KafkaMessage> poll(size_t maxMessages, int timeoutMs) override;
  void commit(const KafkaMessage &message) override;
  void seek(const std::string &topic, int32_t partition,
            int64_t offset) override;
  void close() override;

  void publish(const std::string &topic, const std::string &key,
               const std::string &value) override;
  int flush(int timeoutMs) override;

  KafkaStats getStats() const;

private:
  KafkaConfig config_;
  rd_kafka_t *consumer_{nullptr};
  rd_kafka_t *producer_{nullptr};

  std::atomic<int64_t> messagesProduced_{0};
  std::atomic<int64_t> messagesConsumed_{0};
  std::atomic<int64_t> deliveryFailures_{0};
  std::atomic<int64_t> errors_{0};

  void validateConfig(bool forConsumer) const;

  static void deliveryCallback(rd_kafka_t *rk,
                               const rd_kafka_message_t *message,
                               void *opaque);
};

#endif
