#include "../test_runner.h"
#include "events/topic_router.h"
#include <set>

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "TOPIC ROUTER TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Five topics, one per domain", [&]() {
    auto topics = TopicRouter::allTopics();
    runner.assertEquals(5, topics.size(), "topic count");
    std::set<std::string> names(topics.begin(), topics.end());
    for (const char *expected :
         {"user", "order", "post", "product", "supplier"}) {
      runner.assertTrue(names.count(expected) == 1,
                        std::string("topic ") + expected);
    }
  });

  runner.runTest("Event type names round trip for every kind", [&]() {
    size_t total = 0;
    for (Domain domain : TopicRouter::allDomains()) {
      for (EventKind kind : TopicRouter::kindsOf(domain)) {
        ++total;
        std::string name = TopicRouter::eventTypeName(kind);
        auto parsed = TopicRouter::parseEventType(name);
        runner.assertTrue(parsed.has_value() && *parsed == kind,
                          "round trip " + name);
        runner.assertTrue(TopicRouter::domainOf(kind) == domain,
                          "domain of " + name);
        runner.assertEquals(TopicRouter::domainName(domain) + ".",
                            name.substr(0, name.find('.') + 1),
                            "prefix of " + name);
      }
    }
    runner.assertEquals(19, total, "closed set size");
  });

  runner.runTest("Kinds per domain", [&]() {
    runner.assertEquals(3, TopicRouter::kindsOf(Domain::USER).size(), "user");
    runner.assertEquals(3, TopicRouter::kindsOf(Domain::SUPPLIER).size(),
                        "supplier");
    runner.assertEquals(7, TopicRouter::kindsOf(Domain::PRODUCT).size(),
                        "product");
    runner.assertEquals(2, TopicRouter::kindsOf(Domain::ORDER).size(),
                        "order");
    runner.assertEquals(4, TopicRouter::kindsOf(Domain::POST).size(), "post");
  });

  runner.runTest("Unknown event types", [&]() {
    runner.assertFalse(TopicRouter::parseEventType("user.merged").has_value(),
                       "unknown action");
    runner.assertFalse(TopicRouter::parseEventType("USER.CREATED").has_value(),
                       "case sensitive");
    runner.assertFalse(TopicRouter::parseEventType("").has_value(), "empty");
  });

  runner.runTest("Payload shapes", [&]() {
    runner.assertTrue(TopicRouter::payloadShapeOf(EventKind::USER_UPDATED) ==
                          PayloadShape::FULL_SNAPSHOT,
                      "user.updated carries the full document");
    runner.assertTrue(TopicRouter::payloadShapeOf(EventKind::PRODUCT_DELETED) ==
                          PayloadShape::ENTITY_REF,
                      "product.deleted carries an id");
    runner.assertTrue(TopicRouter::payloadShapeOf(EventKind::ORDER_CANCELLED) ==
                          PayloadShape::ORDER_NUMBER_REF,
                      "order.cancelled carries the order number");
  });

  runner.runTest("Topic membership", [&]() {
    runner.assertTrue(
        TopicRouter::belongsToTopic(EventKind::POST_PUBLISHED, "post"),
        "post.published on post");
    runner.assertFalse(
        TopicRouter::belongsToTopic(EventKind::POST_PUBLISHED, "product"),
        "post.published not on product");
    auto domain = TopicRouter::domainForTopic("supplier");
    runner.assertTrue(domain && *domain == Domain::SUPPLIER, "supplier topic");
    runner.assertFalse(TopicRouter::domainForTopic("inventory").has_value(),
                       "unknown topic");
  });

  runner.runTest("Trace labels and id fields", [&]() {
    runner.assertEquals("USER_CREATED",
                        TopicRouter::traceLabel(EventKind::USER_CREATED),
                        "user label");
    runner.assertEquals("PRODUCT_OUT_OF_STOCK",
                        TopicRouter::traceLabel(EventKind::PRODUCT_OUT_OF_STOCK),
                        "product label");
    runner.assertEquals("supplier_id", TopicRouter::idFieldOf(Domain::SUPPLIER),
                        "supplier id field");
  });

  runner.runTest("Domain list parsing", [&]() {
    runner.assertEquals(5, TopicRouter::parseDomainList("").size(),
                        "empty selects all");
    runner.assertEquals(5, TopicRouter::parseDomainList(" , ").size(),
                        "blank entries select all");
    auto subset = TopicRouter::parseDomainList(" User , order");
    runner.assertEquals(2, subset.size(), "two domains");
    runner.assertTrue(subset[0] == Domain::USER && subset[1] == Domain::ORDER,
                      "order preserved, case folded");
    runner.assertThrows<std::invalid_argument>(
        [] { TopicRouter::parseDomainList("user,inventory"); },
        "unknown domain rejected");
    runner.assertThrows<std::invalid_argument>(
        [] { TopicRouter::parseDomainList("post,post"); },
        "duplicate rejected");
  });

  runner.printSummary();
  return 0;
}
