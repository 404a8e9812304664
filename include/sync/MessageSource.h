#ifndef MESSAGE_SOURCE_H
#define MESSAGE_SOURCE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct KafkaMessage {
  std::string topic;
  int32_t partition = -1;
  int64_t offset = -1;
  std::string key;
  std::string value;

  std::string position() const {
    return topic + "[" + std::to_string(partition) + "]@" +
           std::to_string(offset);
  }
};

// Inbound side of the broker as the dispatcher sees it. Offsets are only
// advanced by explicit commit(); nothing is auto-committed.
class IMessageSource {
public:
  virtual ~IMessageSource() = default;

  virtual void subscribe(const std::vector<std::string> &topics) = 0;

  // Returns up to maxMessages in broker order, waiting at most timeoutMs for
  // the first one. An empty batch is a normal outcome.
  virtual std::vector<KafkaMessage> poll(size_t maxMessages,
                                         int timeoutMs) = 0;

  // Marks the message as consumed: the group resumes after it.
  virtual void commit(const KafkaMessage &message) = 0;

  // Rewinds the partition so the next poll redelivers from offset.
  virtual void seek(const std::string &topic, int32_t partition,
                    int64_t offset) = 0;

  virtual void close() = 0;
};

#endif
