#include "../test_runner.h"
#include "core/errors.h"
#include "core/logger.h"
#include "events/event_emitter.h"
#include <vector>

using json = nlohmann::json;

namespace {
struct PublishedMessage {
  std::string topic;
  std::string key;
  std::string value;
};

class RecordingPublisher : public IEventPublisher {
public:
  std::vector<PublishedMessage> messages;
  bool failNext = false;
  int pending = 0;

  void publish(const std::string &topic, const std::string &key,
               const std::string &value) override {
    if (failNext) {
      failNext = false;
      throw KafkaError("queue full");
    }
    messages.push_back({topic, key, value});
  }

  int flush(int) override { return pending; }
};
} // namespace

int main() {
  TestRunner runner;
  LoggerSettings quiet;
  quiet.level = "CRITICAL";
  Logger::initialize(quiet);

  std::cout << "\n========================================" << std::endl;
  std::cout << "EVENT EMITTER TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Emit routes by kind and keys by entity", [&]() {
    RecordingPublisher publisher;
    EventEmitter emitter(publisher);

    auto envelope =
        emitter.emit(EventKind::SUPPLIER_UPDATED, "s7", json{{"a", 1}});

    runner.assertEquals(1, publisher.messages.size(), "one message");
    runner.assertEquals("supplier", publisher.messages[0].topic, "topic");
    runner.assertEquals("s7", publisher.messages[0].key, "partition key");

    auto decoded = EventEnvelope::decode(publisher.messages[0].value);
    runner.assertEquals("supplier.updated", decoded.eventType(), "type");
    runner.assertEquals(*envelope.eventId(), *decoded.eventId(), "event id");
    runner.assertEquals(1, emitter.emittedCount(), "counter");
  });

  runner.runTest("Nothing is emitted when the write fails", [&]() {
    RecordingPublisher publisher;
    EventEmitter emitter(publisher);

    runner.assertThrows<std::runtime_error>(
        [&] {
          emitter.persistThenEmit(EventKind::ORDER_CREATED,
                                  []() -> PersistedEntity {
                                    throw std::runtime_error("duplicate key");
                                  });
        },
        "write failure propagates");
    runner.assertEquals(0, publisher.messages.size(), "no event emitted");
  });

  runner.runTest("Emit happens after a successful write", [&]() {
    RecordingPublisher publisher;
    EventEmitter emitter(publisher);
    bool written = false;

    bool emitted = emitter.persistThenEmit(EventKind::ORDER_CREATED, [&]() {
      runner.assertEquals(0, publisher.messages.size(),
                          "nothing published before the write");
      written = true;
      return PersistedEntity{"o1", json{{"order_number", "N-1"}}};
    });

    runner.assertTrue(written, "write ran");
    runner.assertTrue(emitted, "emitted");
    runner.assertEquals(1, publisher.messages.size(), "one message");
    runner.assertEquals("o1", publisher.messages[0].key, "key is entity id");
  });

  runner.runTest("Emit failure after a committed write is reported", [&]() {
    RecordingPublisher publisher;
    publisher.failNext = true;
    EventEmitter emitter(publisher);
    bool written = false;

    bool emitted = emitter.persistThenEmit(EventKind::POST_CREATED, [&]() {
      written = true;
      return PersistedEntity{"p1", json::object()};
    });

    runner.assertTrue(written, "write stays done");
    runner.assertFalse(emitted, "reported as not emitted");
    runner.assertEquals(1, emitter.failedEmitCount(), "failure counted");
  });

  runner.runTest("Flush reports undelivered messages", [&]() {
    RecordingPublisher publisher;
    EventEmitter emitter(publisher);
    runner.assertEquals(0, emitter.flush(100), "all delivered");
    publisher.pending = 3;
    runner.assertEquals(3, emitter.flush(100), "three pending");
  });

  Logger::shutdown();
  runner.printSummary();
  return 0;
}
