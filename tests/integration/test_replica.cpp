#include "../test_runner.h"
#include "consumers/OrderConsumer.h"
#include "consumers/PostConsumer.h"
#include "consumers/ProductConsumer.h"
#include "consumers/SupplierConsumer.h"
#include "consumers/UserConsumer.h"
#include "core/logger.h"
#include "dal/order_dal.h"
#include "dal/post_dal.h"
#include "dal/product_dal.h"
#include "dal/supplier_dal.h"
#include "dal/user_dal.h"
#include "db/schema_bootstrap.h"
#include <cstdlib>
#include <pqxx/pqxx>

// End-to-end checks against a live PostgreSQL. The connection string comes
// from argv[1] or EVENTSYNC_TEST_POSTGRES; without one the test is skipped.
// Every row it writes uses an "it-" id and is removed before the run.

using json = nlohmann::json;

namespace {

EventEnvelope envelope(const std::string &type, const std::string &entityId,
                       const json &data, const std::string &timestamp) {
  json doc = {{"event_type", type},
              {"event_id", "it-" + std::to_string(std::rand())},
              {"entity_id", entityId},
              {"timestamp", timestamp},
              {"data", data}};
  return EventEnvelope::decode(doc.dump());
}

void deliver(IDomainConsumer &consumer, const EventEnvelope &event) {
  consumer.getHandlers().at(*event.kind())(event);
}

void cleanup(ConnectionPool &pool) {
  ConnectionGuard guard(pool);
  pqxx::work txn(guard.get());
  txn.exec("DELETE FROM analytics.order_items WHERE order_id LIKE 'it-%'");
  txn.exec("DELETE FROM analytics.orders WHERE order_id LIKE 'it-%'");
  txn.exec(
      "DELETE FROM analytics.product_variants WHERE product_id LIKE 'it-%'");
  txn.exec("DELETE FROM analytics.products WHERE product_id LIKE 'it-%'");
  txn.exec("DELETE FROM analytics.suppliers WHERE supplier_id LIKE 'it-%'");
  txn.exec("DELETE FROM analytics.users WHERE user_id LIKE 'it-%'");
  txn.exec("DELETE FROM analytics.posts WHERE post_id LIKE 'it-%'");
  txn.commit();
}

size_t countRows(ConnectionPool &pool, const std::string &sql) {
  ConnectionGuard guard(pool);
  pqxx::read_transaction txn(guard.get());
  return txn.exec(sql)[0][0].as<size_t>();
}

json userData(const std::string &name, const std::string &createdAt) {
  return {{"contact_info", {{"primary_email", "it@x.io"}}},
          {"profile", {{"display_name", name}}},
          {"version", 1},
          {"created_at", createdAt},
          {"updated_at", "2024-05-01T10:00:00Z"}};
}

json productData(bool withSecondVariant) {
  json data = {{"supplier_id", "it-s1"},
               {"name", "Tee"},
               {"category", "apparel"},
               {"unit_type", "piece"},
               {"base_price_cents", 1500},
               {"status", "active"},
               {"created_at", "2024-05-01T10:00:00Z"},
               {"updated_at", "2024-05-01T10:00:00Z"}};
  data["variants"]["S"] = {{"variant_id", "v1"},
                           {"variant_name", "Small"},
                           {"price_cents", 1500},
                           {"attributes", json::array({{{"size", "S"}}})}};
  if (withSecondVariant) {
    data["variants"]["M"] = {
        {"variant_id", "v2"}, {"variant_name", "Medium"}, {"price_cents", 1600}};
  }
  return data;
}

json orderData(const std::string &status, const std::string &city,
               const std::string &fulfillment) {
  json item = {{"item_id", "i1"},
               {"product_snapshot",
                {{"product_id", "it-p1"},
                 {"supplier_id", "it-s1"},
                 {"product_name", "Tee"},
                 {"variant_attributes", {{"size", "S"}}}}},
               {"quantity", 2},
               {"unit_price_cents", 1500},
               {"final_price_cents", 1500},
               {"total_cents", 3000},
               {"fulfillment_status", fulfillment}};
  return {{"order_number", "IT-ORD-1"},
          {"customer", {{"user_id", "it-u1"}, {"display_name", "Ann"}}},
          {"shipping_address", {{"city", city}, {"country", "US"}}},
          {"items", json::array({item})},
          {"status", status},
          {"created_at", "2024-05-01T10:00:00Z"},
          {"updated_at", "2024-05-01T10:00:00Z"}};
}

} // namespace

int main(int argc, char *argv[]) {
  std::string dsn;
  if (argc > 1) {
    dsn = argv[1];
  } else if (const char *env = std::getenv("EVENTSYNC_TEST_POSTGRES")) {
    dsn = env;
  }
  if (dsn.empty()) {
    std::cout << "EVENTSYNC_TEST_POSTGRES not set, skipping replica "
                 "integration tests"
              << std::endl;
    return SKIP_RETURN_CODE;
  }

  TestRunner runner;
  LoggerSettings quiet;
  quiet.level = "WARNING";
  Logger::initialize(quiet);

  ConnectionPool::PoolConfig config;
  config.connectionString = dsn;
  config.maxConnections = 2;
  ConnectionPool pool(config);
  try {
    pool.initialize();
  } catch (const std::exception &e) {
    std::cerr << "Cannot reach PostgreSQL: " << e.what() << std::endl;
    Logger::shutdown();
    return 1;
  }

  std::cout << "\n========================================" << std::endl;
  std::cout << "REPLICA INTEGRATION TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Schema bootstrap is idempotent", [&]() {
    SchemaBootstrap first(pool);
    first.run();
    SchemaBootstrap second(pool);
    second.run();
    runner.assertTrue(second.executedStatements() +
                              second.toleratedStatements() >
                          0,
                      "second run walked every statement");
  });

  cleanup(pool);

  UserDAL users(pool);
  SupplierDAL suppliers(pool);
  ProductDAL products(pool);
  OrderDAL orders(pool);
  PostDAL posts(pool);

  UserConsumer userConsumer(users);
  SupplierConsumer supplierConsumer(suppliers);
  ProductConsumer productConsumer(products);
  OrderConsumer orderConsumer(orders);
  PostConsumer postConsumer(posts);

  runner.runTest("User replay is idempotent and keeps created_at", [&]() {
    size_t activeBefore = users.countActiveUsers();
    auto created = envelope("user.created", "it-u1",
                            userData("Ann", "2024-01-01T00:00:00Z"),
                            "2024-05-01T10:00:00Z");
    deliver(userConsumer, created);
    deliver(userConsumer, created);
    runner.assertEquals(1, countRows(pool, "SELECT COUNT(*) FROM "
                                           "analytics.users WHERE user_id = "
                                           "'it-u1'"),
                        "one row after replay");

    deliver(userConsumer, envelope("user.updated", "it-u1",
                                   userData("Ann B", "2030-01-01T00:00:00Z"),
                                   "2024-05-02T10:00:00Z"));
    auto row = users.findUser("it-u1");
    runner.assertTrue(row.has_value(), "row present");
    runner.assertEquals("Ann B", row->displayName, "updated");
    runner.assertEquals("2024-01-01T00:00:00.000000Z",
                        TimeUtils::formatIsoUtc(row->createdAt),
                        "created_at never overwritten");
    runner.assertEquals(activeBefore + 1, users.countActiveUsers(),
                        "counted as active");

    deliver(userConsumer, envelope("user.deleted", "it-u1",
                                   json{{"user_id", "it-u1"}},
                                   "2024-05-03T10:00:00Z"));
    row = users.findUser("it-u1");
    runner.assertTrue(row->deletedAt.has_value(), "soft deleted");
    runner.assertEquals(activeBefore, users.countActiveUsers(),
                        "hidden from active users");
  });

  runner.runTest("Supplier delete is a hard delete", [&]() {
    json data = {{"contact_info",
                  {{"primary_email", "s@x.io"}, {"primary_phone", "555"}}},
                 {"company_info",
                  {{"legal_name", "Acme LLC"},
                   {"business_address", {{"city", "Austin"}}}}},
                 {"created_at", "2024-05-01T10:00:00Z"},
                 {"updated_at", "2024-05-01T10:00:00Z"}};
    deliver(supplierConsumer, envelope("supplier.created", "it-s1", data,
                                       "2024-05-01T10:00:00Z"));
    runner.assertEquals("Austin",
                        suppliers.findSupplier("it-s1")->city.value_or(""),
                        "nested address flattened");
    deliver(supplierConsumer, envelope("supplier.deleted", "it-s1",
                                       json{{"supplier_id", "it-s1"}},
                                       "2024-05-02T10:00:00Z"));
    runner.assertFalse(suppliers.findSupplier("it-s1").has_value(), "gone");
  });

  runner.runTest("Product variants are replaced and cascade", [&]() {
    deliver(productConsumer, envelope("product.created", "it-p1",
                                      productData(true),
                                      "2024-05-01T10:00:00Z"));
    runner.assertEquals(2, products.listVariants("it-p1").size(),
                        "two variants");

    deliver(productConsumer, envelope("product.updated", "it-p1",
                                      productData(false),
                                      "2024-05-02T10:00:00Z"));
    auto variants = products.listVariants("it-p1");
    runner.assertEquals(1, variants.size(), "removed variant dropped");
    runner.assertEquals("S", variants[0].variantKey, "remaining key");
    runner.assertEquals(
        "S",
        json::parse(variants[0].attributesJson.value_or("[]"))[0]["size"]
            .get<std::string>(),
        "attributes stored as JSON");

    deliver(productConsumer, envelope("product.deleted", "it-p1",
                                      json{{"product_id", "it-p1"}},
                                      "2024-05-03T10:00:00Z"));
    runner.assertFalse(products.findProduct("it-p1").has_value(),
                       "product deleted");
    runner.assertEquals(0,
                        countRows(pool, "SELECT COUNT(*) FROM "
                                        "analytics.product_variants WHERE "
                                        "product_id = 'it-p1'"),
                        "variants cascaded");
  });

  runner.runTest("Order upserts only move lifecycle columns forward", [&]() {
    deliver(orderConsumer,
            envelope("order.created", "it-o1",
                     orderData("pending", "Austin", "pending"),
                     "2024-05-01T10:00:00Z"));
    deliver(orderConsumer,
            envelope("order.created", "it-o1",
                     orderData("processing", "Dallas", "shipped"),
                     "2024-05-02T10:00:00Z"));

    auto order = orders.findOrder("it-o1");
    runner.assertEquals("processing", order->status, "status advanced");
    runner.assertEquals("Austin", order->shippingCity.value_or(""),
                        "shipping snapshot kept");
    auto items = orders.findOrderItems("it-o1");
    runner.assertEquals(1, items.size(), "one item");
    runner.assertEquals("shipped", items[0].fulfillmentStatus,
                        "fulfillment advanced");
    runner.assertEquals("Tee", items[0].productName.value_or(""),
                        "product snapshot kept");

    deliver(orderConsumer,
            envelope("order.created", "it-o1",
                     orderData("pending", "Austin", "pending"),
                     "2024-04-30T10:00:00Z"));
    runner.assertEquals("processing", orders.findOrder("it-o1")->status,
                        "stale event ignored");
    runner.assertEquals("shipped",
                        orders.findOrderItems("it-o1")[0].fulfillmentStatus,
                        "stale item update ignored");
  });

  runner.runTest("Order cancel and cascade delete", [&]() {
    deliver(orderConsumer,
            envelope("order.cancelled", "it-o1",
                     json{{"order_number", "IT-ORD-1"}},
                     "2024-05-03T10:00:00Z"));
    runner.assertEquals("cancelled", orders.findOrder("it-o1")->status,
                        "cancelled by order number");

    EventBookkeeping event;
    runner.assertFalse(orders.cancelOrder("IT-ORD-404", event),
                       "unknown order number reports false");

    orders.deleteOrder("it-o1");
    runner.assertEquals(0,
                        countRows(pool, "SELECT COUNT(*) FROM "
                                        "analytics.order_items WHERE "
                                        "order_id = 'it-o1'"),
                        "items cascaded");
  });

  runner.runTest("Post soft delete keeps the row", [&]() {
    size_t activeBefore = posts.countActivePosts();
    json data = {{"post_type", "text"},
                 {"author", {{"user_id", "it-u1"}}},
                 {"text_content", "hello"},
                 {"media", json::array()},
                 {"stats", {{"like_count", 2}, {"engagement_rate", 0.25}}},
                 {"created_at", "2024-05-01T10:00:00Z"},
                 {"updated_at", "2024-05-01T10:00:00Z"}};
    deliver(postConsumer,
            envelope("post.created", "it-po1", data, "2024-05-01T10:00:00Z"));
    auto post = posts.findPost("it-po1");
    runner.assertFalse(post->mediaJson.has_value(), "empty media is NULL");
    runner.assertEquals(2, post->likeCount, "stats flattened");
    runner.assertEquals(activeBefore + 1, posts.countActivePosts(), "active");

    deliver(postConsumer, envelope("post.deleted", "it-po1",
                                   json{{"post_id", "it-po1"}},
                                   "2024-05-02T10:00:00Z"));
    post = posts.findPost("it-po1");
    runner.assertTrue(post.has_value() && post->deletedAt.has_value(),
                      "row kept with deleted_at");
    runner.assertEquals(activeBefore, posts.countActivePosts(),
                        "hidden from active posts");
  });

  cleanup(pool);
  pool.shutdown();
  Logger::shutdown();
  runner.printSummary();
  return 0;
}
