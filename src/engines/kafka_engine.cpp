#include "engines/kafka_engine.h"
#include "core/errors.h"
#include "core/logger.h"
#include <librdkafka/rdkafka.h>
#include <memory>

namespace {

struct PartitionListDeleter {
  void operator()(rd_kafka_topic_partition_list_t *list) const {
    rd_kafka_topic_partition_list_destroy(list);
  }
};
using PartitionList =
    std::unique_ptr<rd_kafka_topic_partition_list_t, PartitionListDeleter>;

struct MessageDeleter {
  void operator()(rd_kafka_message_t *message) const {
    rd_kafka_message_destroy(message);
  }
};
using MessagePtr = std::unique_ptr<rd_kafka_message_t, MessageDeleter>;

void setConf(rd_kafka_conf_t *conf, const std::string &name,
             const std::string &value) {
  char errstr[512];
  if (rd_kafka_conf_set(conf, name.c_str(), value.c_str(), errstr,
                        sizeof(errstr)) != RD_KAFKA_CONF_OK) {
    rd_kafka_conf_destroy(conf);
    throw KafkaError("Invalid Kafka setting " + name + "=" + value + ": " +
                     errstr);
  }
}

} // namespace

KafkaEngine::KafkaEngine(const KafkaConfig &config) : config_(config) {
  Logger::info(LogCategory::KAFKA, "KafkaEngine",
               "Initializing KafkaEngine with brokers: " + config_.brokers);
}

KafkaEngine::~KafkaEngine() {
  close();
  if (producer_) {
    int remaining = flush(5000);
    if (remaining > 0) {
      Logger::warning(LogCategory::KAFKA, "KafkaEngine",
                      std::to_string(remaining) +
                          " message(s) dropped at shutdown");
    }
    rd_kafka_destroy(producer_);
    producer_ = nullptr;
  }
}

void KafkaEngine::validateConfig(bool forConsumer) const {
  if (config_.brokers.empty())
    throw KafkaError("Brokers list cannot be empty");
  if (forConsumer && config_.groupId.empty())
    throw KafkaError("Consumer group id cannot be empty");
}

// Offsets are committed by hand after each message is applied, so
// auto-commit and the background offset store are both off.
void KafkaEngine::initializeConsumer() {
  if (consumer_)
    return;
  validateConfig(true);

  rd_kafka_conf_t *conf = rd_kafka_conf_new();
  setConf(conf, "bootstrap.servers", config_.brokers);
  setConf(conf, "client.id", config_.clientId);
  setConf(conf, "group.id", config_.groupId);
  setConf(conf, "enable.auto.commit", "false");
  setConf(conf, "enable.auto.offset.store", "false");
  setConf(conf, "auto.offset.reset", config_.autoOffsetReset);
  setConf(conf, "session.timeout.ms", std::to_string(config_.sessionTimeoutMs));
  for (const auto &[name, value] : config_.kafkaConf)
    setConf(conf, name, value);

  char errstr[512];
  consumer_ = rd_kafka_new(RD_KAFKA_CONSUMER, conf, errstr, sizeof(errstr));
  if (!consumer_) {
    rd_kafka_conf_destroy(conf);
    throw KafkaError(std::string("Failed to create consumer: ") + errstr);
  }
  rd_kafka_poll_set_consumer(consumer_);

  Logger::info(LogCategory::KAFKA, "KafkaEngine",
               "Consumer created for group " + config_.groupId);
}

void KafkaEngine::initializeProducer() {
  if (producer_)
    return;
  validateConfig(false);

  rd_kafka_conf_t *conf = rd_kafka_conf_new();
  setConf(conf, "bootstrap.servers", config_.brokers);
  setConf(conf, "client.id", config_.clientId);
  setConf(conf, "acks", "all");
  for (const auto &[name, value] : config_.kafkaConf)
    setConf(conf, name, value);
  rd_kafka_conf_set_dr_msg_cb(conf, &KafkaEngine::deliveryCallback);
  rd_kafka_conf_set_opaque(conf, this);

  char errstr[512];
  producer_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
  if (!producer_) {
    rd_kafka_conf_destroy(conf);
    throw KafkaError(std::string("Failed to create producer: ") + errstr);
  }

  Logger::info(LogCategory::KAFKA, "KafkaEngine", "Producer created");
}

void KafkaEngine::subscribe(const std::vector<std::string> &topics) {
  initializeConsumer();

  PartitionList list(
      rd_kafka_topic_partition_list_new(static_cast<int>(topics.size())));
  for (const auto &topic : topics)
    rd_kafka_topic_partition_list_add(list.get(), topic.c_str(),
                                      RD_KAFKA_PARTITION_UA);

  rd_kafka_resp_err_t err = rd_kafka_subscribe(consumer_, list.get());
  if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
    throw KafkaError("Failed to subscribe: " +
                     std::string(rd_kafka_err2str(err)));
  }

  Logger::info(LogCategory::KAFKA, "KafkaEngine",
               "Subscribed to " + std::to_string(topics.size()) + " topics");
}

// Waits up to timeoutMs for the first message, then drains whatever is
// already buffered without blocking. Broker errors that are not fatal
// (partition EOF, unknown topic while it is being created) are logged and
// the batch continues.
std::vector<KafkaMessage> KafkaEngine::poll(size_t maxMessages,
                                            int timeoutMs) {
  std::vector<KafkaMessage> messages;
  if (!consumer_) {
    throw KafkaError("Cannot poll: consumer not initialized");
  }

  int wait = timeoutMs;
  while (messages.size() < maxMessages) {
    MessagePtr msg(rd_kafka_consumer_poll(consumer_, wait));
    wait = 0;
    if (!msg)
      break;

    if (msg->err) {
      if (msg->err == RD_KAFKA_RESP_ERR__PARTITION_EOF)
        continue;
      errors_++;
      std::string reason = rd_kafka_message_errstr(msg.get());
      if (msg->err == RD_KAFKA_RESP_ERR_UNKNOWN_TOPIC_OR_PART ||
          msg->err == RD_KAFKA_RESP_ERR__UNKNOWN_TOPIC) {
        Logger::warning(LogCategory::KAFKA, "KafkaEngine",
                        "Topic not available yet: " + reason);
        continue;
      }
      Logger::error(LogCategory::KAFKA, "KafkaEngine",
                    "Consumer error: " + reason);
      continue;
    }

    KafkaMessage message;
    message.topic = msg->rkt ? rd_kafka_topic_name(msg->rkt) : "";
    message.partition = msg->partition;
    message.offset = msg->offset;
    if (msg->key)
      message.key.assign(static_cast<const char *>(msg->key), msg->key_len);
    if (msg->payload)
      message.value.assign(static_cast<const char *>(msg->payload), msg->len);
    messages.push_back(std::move(message));
    messagesConsumed_++;
  }

  return messages;
}

void KafkaEngine::commit(const KafkaMessage &message) {
  if (!consumer_)
    throw KafkaError("Cannot commit: consumer not initialized");

  PartitionList offsets(rd_kafka_topic_partition_list_new(1));
  rd_kafka_topic_partition_list_add(offsets.get(), message.topic.c_str(),
                                    message.partition)
      ->offset = message.offset + 1;

  rd_kafka_resp_err_t err = rd_kafka_commit(consumer_, offsets.get(), 0);
  if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
    errors_++;
    throw KafkaError("Failed to commit " + message.position() + ": " +
                     rd_kafka_err2str(err));
  }
}

void KafkaEngine::seek(const std::string &topic, int32_t partition,
                       int64_t offset) {
  if (!consumer_)
    throw KafkaError("Cannot seek: consumer not initialized");

  PartitionList positions(rd_kafka_topic_partition_list_new(1));
  rd_kafka_topic_partition_list_add(positions.get(), topic.c_str(), partition)
      ->offset = offset;

  rd_kafka_error_t *error =
      rd_kafka_seek_partitions(consumer_, positions.get(), 5000);
  if (error) {
    std::string reason = rd_kafka_error_string(error);
    rd_kafka_error_destroy(error);
    errors_++;
    throw KafkaError("Failed to seek " + topic + "[" +
                     std::to_string(partition) + "] to " +
                     std::to_string(offset) + ": " + reason);
  }
}

void KafkaEngine::close() {
  if (!consumer_)
    return;

  rd_kafka_resp_err_t err = rd_kafka_consumer_close(consumer_);
  if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
    Logger::warning(LogCategory::KAFKA, "KafkaEngine",
                    "Consumer close reported: " +
                        std::string(rd_kafka_err2str(err)));
  }
  rd_kafka_destroy(consumer_);
  consumer_ = nullptr;
  Logger::info(LogCategory::KAFKA, "KafkaEngine", "Consumer closed");
}

// A full local queue is retried once after serving delivery reports; any
// other refusal is raised to the caller.
void KafkaEngine::publish(const std::string &topic, const std::string &key,
                          const std::string &value) {
  initializeProducer();

  for (int attempt = 0; attempt < 2; ++attempt) {
    rd_kafka_resp_err_t err = rd_kafka_producev(
        producer_, RD_KAFKA_V_TOPIC(topic.c_str()),
        RD_KAFKA_V_KEY(key.data(), key.size()),
        RD_KAFKA_V_VALUE(const_cast<char *>(value.data()), value.size()),
        RD_KAFKA_V_MSGFLAGS(RD_KAFKA_MSG_F_COPY), RD_KAFKA_V_END);

    if (err == RD_KAFKA_RESP_ERR_NO_ERROR) {
      messagesProduced_++;
      rd_kafka_poll(producer_, 0);
      return;
    }

    if (err == RD_KAFKA_RESP_ERR__QUEUE_FULL && attempt == 0) {
      rd_kafka_poll(producer_, 1000);
      continue;
    }

    errors_++;
    throw KafkaError("Failed to produce to " + topic + ": " +
                     rd_kafka_err2str(err));
  }
}

int KafkaEngine::flush(int timeoutMs) {
  if (!producer_)
    return 0;
  rd_kafka_flush(producer_, timeoutMs);
  return rd_kafka_outq_len(producer_);
}

KafkaEngine::KafkaStats KafkaEngine::getStats() const {
  KafkaStats stats;
  stats.messagesProduced = messagesProduced_.load();
  stats.messagesConsumed = messagesConsumed_.load();
  stats.deliveryFailures = deliveryFailures_.load();
  stats.errors = errors_.load();
  return stats;
}

void KafkaEngine::deliveryCallback(rd_kafka_t *, const rd_kafka_message_t *message,
                                   void *opaque) {
  auto *self = static_cast<KafkaEngine *>(opaque);
  std::string topic = message->rkt ? rd_kafka_topic_name(message->rkt) : "";

  if (message->err) {
    if (self)
      self->deliveryFailures_++;
    Logger::error(LogCategory::PRODUCER, "KafkaEngine",
                  "Delivery to " + topic + " failed: " +
                      rd_kafka_err2str(message->err));
    return;
  }

  Logger::debug(LogCategory::PRODUCER, "KafkaEngine",
                "Delivered to " + topic + "[" +
                    std::to_string(message->partition) + "]@" +
                    std::to_string(message->offset));
}
