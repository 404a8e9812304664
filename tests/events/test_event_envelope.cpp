#include "../test_runner.h"
#include "core/errors.h"
#include "core/logger.h"
#include "events/event_envelope.h"
#include "utils/uuid_utils.h"

using json = nlohmann::json;

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "EVENT ENVELOPE TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Decode a complete envelope", [&]() {
    auto envelope = EventEnvelope::decode(R"({
      "event_type": "user.created",
      "event_id": "0b7f5a52-6a53-4d0e-9d6f-3f6a1c2b9e10",
      "entity_id": "u1",
      "timestamp": "2024-05-01T10:00:00Z",
      "data": {"profile": {"display_name": "Ann"}}})");

    runner.assertEquals("user.created", envelope.eventType(), "event type");
    runner.assertEquals("u1", envelope.entityId(), "entity id");
    runner.assertTrue(envelope.eventId().has_value(), "event id present");
    runner.assertTrue(envelope.timestamp().has_value(), "timestamp present");
    runner.assertEquals("2024-05-01T10:00:00.000000Z",
                        TimeUtils::formatIsoUtc(*envelope.timestamp()),
                        "timestamp normalised to UTC");
    runner.assertTrue(envelope.kind() == EventKind::USER_CREATED, "kind");
    runner.assertEquals("Ann",
                        envelope.data()["profile"]["display_name"]
                            .get<std::string>(),
                        "data preserved");
  });

  runner.runTest("Optional fields default", [&]() {
    auto envelope = EventEnvelope::decode(
        R"({"event_type": "post.deleted", "entity_id": "p9"})");
    runner.assertFalse(envelope.eventId().has_value(), "no event id");
    runner.assertFalse(envelope.timestamp().has_value(), "no timestamp");
    runner.assertTrue(envelope.data().is_object() && envelope.data().empty(),
                      "data defaults to {}");

    auto nullData = EventEnvelope::decode(
        R"({"event_type": "post.deleted", "entity_id": "p9", "data": null})");
    runner.assertTrue(nullData.data().is_object(), "null data reads as {}");
  });

  runner.runTest("Numeric entity id is accepted", [&]() {
    auto envelope = EventEnvelope::decode(
        R"({"event_type": "order.created", "entity_id": 42})");
    runner.assertEquals("42", envelope.entityId(), "entity id as text");
  });

  runner.runTest("Unknown event type still decodes", [&]() {
    auto envelope = EventEnvelope::decode(
        R"({"event_type": "user.merged", "entity_id": "u1"})");
    runner.assertFalse(envelope.kind().has_value(),
                       "kind is empty for unknown types");
  });

  runner.runTest("Malformed envelopes are rejected", [&]() {
    const char *bad[] = {
        "not json at all",
        "[1, 2, 3]",
        R"({"entity_id": "u1"})",
        R"({"event_type": "user.created"})",
        R"({"event_type": "", "entity_id": "u1"})",
        R"({"event_type": "user.created", "entity_id": ""})",
        R"({"event_type": 7, "entity_id": "u1"})",
        R"({"event_type": "user.created", "entity_id": "u1", "data": [1]})",
        R"({"event_type": "user.created", "entity_id": "u1",
            "timestamp": "yesterday"})",
    };
    for (const char *raw : bad) {
      runner.assertThrows<EnvelopeDecodeError>(
          [raw] { EventEnvelope::decode(raw); },
          std::string("rejected: ") + raw);
    }
  });

  runner.runTest("Create and encode", [&]() {
    auto envelope = EventEnvelope::create(EventKind::PRODUCT_PUBLISHED, "p1",
                                          json{{"status", "active"}});
    runner.assertEquals("product.published", envelope.eventType(), "type");
    runner.assertTrue(envelope.eventId().has_value(), "event id assigned");
    runner.assertTrue(UuidUtils::isCanonical(*envelope.eventId()),
                      "event id is a canonical UUID");
    runner.assertTrue(envelope.timestamp().has_value(), "timestamp assigned");

    json wire = json::parse(envelope.encode());
    runner.assertEquals("product.published",
                        wire["event_type"].get<std::string>(), "wire type");
    runner.assertEquals("p1", wire["entity_id"].get<std::string>(),
                        "wire entity id");
    runner.assertEquals(*envelope.eventId(),
                        wire["event_id"].get<std::string>(), "wire event id");
    std::string ts = wire["timestamp"].get<std::string>();
    runner.assertTrue(!ts.empty() && ts.back() == 'Z', "wire timestamp is UTC");
    runner.assertEquals("active", wire["data"]["status"].get<std::string>(),
                        "wire data");

    auto again = EventEnvelope::create(EventKind::PRODUCT_PUBLISHED, "p1",
                                       json::object());
    runner.assertTrue(*again.eventId() != *envelope.eventId(),
                      "every envelope gets a fresh id");
  });

  runner.runTest("Describe names kind, entity and event id", [&]() {
    auto envelope = EventEnvelope::decode(
        R"({"event_type": "order.cancelled", "entity_id": "o1"})");
    std::string text = envelope.describe();
    runner.assertTrue(text.find("order.cancelled") != std::string::npos,
                      "type");
    runner.assertTrue(text.find("o1") != std::string::npos, "entity");
    runner.assertTrue(text.find("<none>") != std::string::npos,
                      "missing event id marked");
  });

  runner.printSummary();
  return 0;
}
