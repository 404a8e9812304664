#include "../test_runner.h"
#include "consumers/OrderConsumer.h"
#include "consumers/PostConsumer.h"
#include "consumers/ProductConsumer.h"
#include "consumers/SupplierConsumer.h"
#include "consumers/UserConsumer.h"
#include "core/logger.h"
#include "recording_dals.h"

using json = nlohmann::json;

namespace {
EventEnvelope envelope(const std::string &type, const std::string &entityId,
                       const json &data,
                       const std::string &timestamp = "2024-05-01T10:00:00Z") {
  json doc = {{"event_type", type},
              {"event_id", "evt-" + type + "-" + entityId},
              {"entity_id", entityId},
              {"timestamp", timestamp},
              {"data", data}};
  return EventEnvelope::decode(doc.dump());
}

void deliver(IDomainConsumer &consumer, const EventEnvelope &event) {
  auto handlers = consumer.getHandlers();
  handlers.at(*event.kind())(event);
}

json userSnapshot() {
  return json::parse(R"({
    "contact_info": {"primary_email": "a@x.io", "phone": "+1"},
    "profile": {"display_name": "Ann", "avatar": null, "bio": "hi"},
    "version": 2,
    "created_at": "2024-01-01T00:00:00Z",
    "updated_at": "2024-01-02T00:00:00Z"})");
}

json supplierSnapshot() {
  return json::parse(R"({
    "contact_info": {"primary_email": "s@x.io", "primary_phone": "555",
                     "contact_person_name": "Sam"},
    "company_info": {"legal_name": "Acme LLC", "dba_name": "Acme",
                     "business_address": {"street_address_1": "1 Main",
                                          "city": "Austin", "state": "TX",
                                          "zip_code": "78701",
                                          "country": "US"}},
    "business_info": {"support_email": "help@x.io", "timezone": "UTC"},
    "created_at": "2024-01-01T00:00:00Z",
    "updated_at": "2024-01-01T00:00:00Z"})");
}

json productSnapshot() {
  return json::parse(R"({
    "supplier_id": "s1",
    "supplier_info": {"legal_name": "Acme LLC"},
    "name": "Tee",
    "category": "apparel",
    "unit_type": "piece",
    "metadata": {"base_sku": "TEE", "brand": "Acme"},
    "variants": {
      "S-RED": {"variant_id": "v1", "variant_name": "Small Red",
                "attributes": [{"attribute_name": "size",
                                "attribute_value": "S"}],
                "price_cents": 1500, "quantity": 4,
                "package_dimensions": {"width_cm": 10, "height_cm": 2.5}},
      "M-RED": {"variant_id": "v2", "variant_name": "Medium Red",
                "price_cents": 1600}
    },
    "base_price_cents": 1500,
    "status": "draft",
    "stats": {"view_count": 9},
    "created_at": "2024-01-01T00:00:00Z",
    "updated_at": "2024-01-01T00:00:00Z"})");
}

json orderSnapshot() {
  return json::parse(R"({
    "order_number": "ORD-1",
    "customer": {"user_id": "u1", "display_name": "Ann", "email": "a@x.io"},
    "shipping_address": {"recipient_name": "Ann", "city": "Austin",
                         "country": "US"},
    "items": [
      {"item_id": "i1",
       "product_snapshot": {"product_id": "p1", "supplier_id": "s1",
                            "product_name": "Tee", "variant_name": "Small Red",
                            "variant_attributes": {"size": "S"},
                            "supplier_name": "Acme LLC"},
       "quantity": 2, "unit_price_cents": 1500, "final_price_cents": 1400,
       "total_cents": 2800},
      {"item_id": "i2",
       "product_snapshot": {"product_id": "p2", "supplier_id": "s1"},
       "quantity": 1, "unit_price_cents": 500, "final_price_cents": 500,
       "total_cents": 500, "fulfillment_status": "shipped",
       "shipped_quantity": 1, "carrier": "UPS",
       "shipped_at": "2024-05-02T08:00:00Z"}
    ],
    "status": "pending",
    "created_at": "2024-05-01T10:00:00Z",
    "updated_at": "2024-05-01T10:00:00Z"})");
}

json postSnapshot() {
  return json::parse(R"({
    "post_type": "text",
    "author": {"user_id": "u1", "display_name": "Ann",
               "author_type": "user"},
    "text_content": "hello",
    "media": [],
    "link_preview": null,
    "stats": {"like_count": 3, "engagement_rate": 0.5,
              "last_comment_at": "2024-05-01T11:00:00+01:00"},
    "published_at": null,
    "created_at": "2024-05-01T10:00:00Z",
    "updated_at": "2024-05-01T10:00:00Z"})");
}
} // namespace

int main() {
  TestRunner runner;
  LoggerSettings quiet;
  quiet.level = "ERROR";
  Logger::initialize(quiet);

  std::cout << "\n========================================" << std::endl;
  std::cout << "DOMAIN CONSUMER FLATTENING TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Every consumer handles every kind of its domain", [&]() {
    RecordingUserDAL users;
    RecordingSupplierDAL suppliers;
    RecordingProductDAL products;
    RecordingOrderDAL orders;
    RecordingPostDAL posts;
    UserConsumer u(users);
    SupplierConsumer s(suppliers);
    ProductConsumer p(products);
    OrderConsumer o(orders);
    PostConsumer po(posts);

    IDomainConsumer *consumers[] = {&u, &s, &p, &o, &po};
    for (IDomainConsumer *consumer : consumers) {
      auto handlers = consumer->getHandlers();
      const auto &kinds = TopicRouter::kindsOf(consumer->getDomain());
      runner.assertEquals(kinds.size(), handlers.size(),
                          "handler count for " +
                              TopicRouter::domainName(consumer->getDomain()));
      for (EventKind kind : kinds) {
        runner.assertTrue(handlers.count(kind) == 1,
                          "handler for " + TopicRouter::eventTypeName(kind));
      }
    }
  });

  runner.runTest("User created flattens nested objects", [&]() {
    RecordingUserDAL dal;
    UserConsumer consumer(dal);
    deliver(consumer, envelope("user.created", "u1", userSnapshot()));

    auto row = dal.findUser("u1");
    runner.assertTrue(row.has_value(), "row written");
    runner.assertEquals("a@x.io", row->email, "email from contact_info");
    runner.assertEquals("Ann", row->displayName, "display name from profile");
    runner.assertFalse(row->avatar.has_value(), "null avatar stays NULL");
    runner.assertEquals("hi", row->bio.value_or(""), "bio");
    runner.assertEquals(2, row->version, "version");
    runner.assertEquals("evt-user.created-u1", row->event.eventId.value_or(""),
                        "event id bookkept");
    runner.assertEquals("2024-01-01T00:00:00.000000Z",
                        TimeUtils::formatIsoUtc(row->createdAt), "created_at");
  });

  runner.runTest("User updated reuses the upsert routine", [&]() {
    RecordingUserDAL dal;
    UserConsumer consumer(dal);
    deliver(consumer, envelope("user.created", "u1", userSnapshot()));
    json updated = userSnapshot();
    updated["profile"]["display_name"] = "Ann B";
    updated["created_at"] = "2030-01-01T00:00:00Z";
    deliver(consumer, envelope("user.updated", "u1", updated));

    runner.assertEquals(2, dal.calls.size(), "two upserts");
    runner.assertEquals("upsertUser:u1", dal.calls[1], "same routine");
    runner.assertEquals("Ann B", dal.findUser("u1")->displayName, "updated");
  });

  runner.runTest("User deleted takes the id from the payload", [&]() {
    RecordingUserDAL dal;
    UserConsumer consumer(dal);
    deliver(consumer, envelope("user.created", "u1", userSnapshot()));
    deliver(consumer,
            envelope("user.deleted", "ignored", json{{"user_id", "u1"}}));
    deliver(consumer, envelope("user.deleted", "u2", json::object()));

    runner.assertEquals("softDeleteUser:u1", dal.calls[1], "payload id");
    runner.assertEquals("softDeleteUser:u2", dal.calls[2],
                        "entity id fallback");
    runner.assertTrue(dal.findUser("u1")->deletedAt.has_value(),
                      "soft deleted");
    runner.assertEquals(0, dal.countActiveUsers(), "excluded from active");
  });

  runner.runTest("Missing required fields raise PayloadFieldError", [&]() {
    RecordingUserDAL dal;
    UserConsumer consumer(dal);
    json noEmail = userSnapshot();
    noEmail["contact_info"].erase("primary_email");
    json noCreated = userSnapshot();
    noCreated.erase("created_at");
    json badTime = userSnapshot();
    badTime["updated_at"] = "next tuesday";

    for (const json &data : {noEmail, noCreated, badTime}) {
      runner.assertThrows<PayloadFieldError>(
          [&] { deliver(consumer, envelope("user.created", "u1", data)); },
          "rejected");
    }
    runner.assertEquals(0, dal.calls.size(), "nothing written");
  });

  runner.runTest("Supplier collapses three nested objects", [&]() {
    RecordingSupplierDAL dal;
    SupplierConsumer consumer(dal);
    deliver(consumer, envelope("supplier.created", "s1", supplierSnapshot()));

    auto row = dal.findSupplier("s1");
    runner.assertTrue(row.has_value(), "row written");
    runner.assertEquals("555", row->primaryPhone, "contact info");
    runner.assertEquals("Acme LLC", row->legalName, "company info");
    runner.assertEquals("Austin", row->city.value_or(""),
                        "doubly nested business address");
    runner.assertEquals("US", row->country.value_or(""), "country");
    runner.assertEquals("UTC", row->timezone.value_or(""), "business info");
    runner.assertFalse(row->twitterHandle.has_value(), "absent optional");

    deliver(consumer,
            envelope("supplier.deleted", "s1", json{{"supplier_id", "s1"}}));
    runner.assertFalse(dal.findSupplier("s1").has_value(), "hard deleted");
  });

  runner.runTest("Product writes parent then replaces variants", [&]() {
    RecordingProductDAL dal;
    ProductConsumer consumer(dal);
    deliver(consumer, envelope("product.created", "p1", productSnapshot()));

    runner.assertEquals(2, dal.calls.size(), "two DAL calls");
    runner.assertEquals("upsertProduct:p1", dal.calls[0], "parent first");
    runner.assertEquals("replaceVariants:p1:2", dal.calls[1],
                        "children second");

    auto product = dal.findProduct("p1");
    runner.assertEquals("Acme LLC", product->supplierName.value_or(""),
                        "supplier name");
    runner.assertEquals("TEE", product->baseSku.value_or(""), "metadata");
    runner.assertEquals(9, product->viewCount, "stats");
    runner.assertEquals(0, product->purchaseCount, "missing stat defaults");

    std::map<std::string, ProductVariantRow> byKey;
    for (const auto &v : dal.listVariants("p1"))
      byKey[v.variantKey] = v;
    runner.assertTrue(byKey.count("S-RED") && byKey.count("M-RED"),
                      "variant keys from the map");
    const auto &small = byKey["S-RED"];
    runner.assertEquals("v1", small.variantId, "variant id");
    runner.assertTrue(small.widthCm && *small.widthCm == 10.0,
                      "package width");
    runner.assertTrue(small.heightCm && *small.heightCm == 2.5,
                      "package height");
    runner.assertFalse(small.depthCm.has_value(), "absent depth");
    runner.assertEquals(
        "S",
        json::parse(small.attributesJson.value_or("[]"))[0]["attribute_value"]
            .get<std::string>(),
        "attributes kept as JSON");
    runner.assertFalse(byKey["M-RED"].attributesJson.has_value(),
                       "no attributes stays NULL");
    runner.assertEquals(0, byKey["M-RED"].quantity, "quantity default");
  });

  runner.runTest("Every product lifecycle kind replaces variants", [&]() {
    RecordingProductDAL dal;
    ProductConsumer consumer(dal);
    deliver(consumer, envelope("product.created", "p1", productSnapshot()));

    json fewer = productSnapshot();
    fewer["variants"].erase("M-RED");
    fewer["status"] = "active";
    for (const char *type : {"product.updated", "product.published",
                             "product.discontinued", "product.out_of_stock",
                             "product.restored"}) {
      deliver(consumer, envelope(type, "p1", fewer));
    }
    runner.assertEquals(12, dal.calls.size(), "parent + children each time");
    runner.assertEquals(1, dal.listVariants("p1").size(),
                        "removed variant gone");
    runner.assertEquals("active", dal.findProduct("p1")->status, "status");

    deliver(consumer,
            envelope("product.deleted", "p1", json{{"product_id", "p1"}}));
    runner.assertFalse(dal.findProduct("p1").has_value(), "deleted");
  });

  runner.runTest("Product payload without variants keeps the stored set", [&]() {
    RecordingProductDAL dal;
    ProductConsumer consumer(dal);
    deliver(consumer, envelope("product.created", "p1", productSnapshot()));

    json noVariants = productSnapshot();
    noVariants.erase("variants");
    noVariants["status"] = "active";
    deliver(consumer, envelope("product.published", "p1", noVariants));

    runner.assertEquals(3, dal.calls.size(), "parent upsert only");
    runner.assertEquals("upsertProduct:p1", dal.calls[2], "parent rewritten");
    runner.assertEquals(2, dal.listVariants("p1").size(), "variants kept");
    runner.assertEquals("active", dal.findProduct("p1")->status, "status");

    json nullVariants = productSnapshot();
    nullVariants["variants"] = nullptr;
    deliver(consumer, envelope("product.updated", "p1", nullVariants));
    runner.assertEquals(2, dal.listVariants("p1").size(),
                        "null variants keep the set");

    json emptyVariants = productSnapshot();
    emptyVariants["variants"] = json::object();
    deliver(consumer, envelope("product.discontinued", "p1", emptyVariants));
    runner.assertEquals("replaceVariants:p1:0", dal.calls.back(),
                        "explicit empty object replaces");
    runner.assertEquals(0, dal.listVariants("p1").size(), "variants cleared");

    json wrongShape = productSnapshot();
    wrongShape["variants"] = json::array();
    runner.assertThrows<PayloadFieldError>(
        [&] { deliver(consumer, envelope("product.updated", "p1", wrongShape)); },
        "variants must be an object");
  });

  runner.runTest("Variant missing a required field names its path", [&]() {
    RecordingProductDAL dal;
    ProductConsumer consumer(dal);
    json data = productSnapshot();
    data["variants"]["S-RED"].erase("price_cents");
    try {
      deliver(consumer, envelope("product.created", "p1", data));
      runner.assertTrue(false, "should throw");
    } catch (const PayloadFieldError &e) {
      runner.assertEquals("variants.S-RED.price_cents", e.field(), "path");
    }
    runner.assertEquals(0, dal.calls.size(), "nothing written");
  });

  runner.runTest("Order flattens items from product snapshots", [&]() {
    RecordingOrderDAL dal;
    OrderConsumer consumer(dal);
    deliver(consumer, envelope("order.created", "o1", orderSnapshot()));

    runner.assertEquals("upsertOrder:o1", dal.calls[0], "parent first");
    runner.assertEquals("upsertOrderItems:o1:2", dal.calls[1],
                        "items second");

    auto order = dal.findOrder("o1");
    runner.assertEquals("ORD-1", order->orderNumber, "order number");
    runner.assertEquals("u1", order->customerUserId, "customer");
    runner.assertEquals("Austin", order->shippingCity.value_or(""),
                        "shipping");
    runner.assertFalse(order->shippingStreet1.has_value(), "absent street");

    auto items = dal.findOrderItems("o1");
    runner.assertEquals("p1", items[0].productId, "snapshot product id");
    runner.assertEquals("Tee", items[0].productName.value_or(""),
                        "snapshot name");
    runner.assertEquals("pending", items[0].fulfillmentStatus,
                        "fulfillment default");
    runner.assertEquals(0, items[0].shippedQuantity, "shipped default");
    runner.assertEquals(
        "S",
        json::parse(items[0].variantAttributesJson.value_or("{}"))["size"]
            .get<std::string>(),
        "variant attributes JSON");
    runner.assertEquals("{}", items[1].variantAttributesJson.value_or(""),
                        "missing attributes default to {}");
    runner.assertEquals("shipped", items[1].fulfillmentStatus, "status");
    runner.assertTrue(items[1].shippedAt.has_value(), "item timestamp");
  });

  runner.runTest("Order cancelled uses the order number", [&]() {
    RecordingOrderDAL dal;
    OrderConsumer consumer(dal);
    deliver(consumer, envelope("order.created", "o1", orderSnapshot()));
    deliver(consumer, envelope("order.cancelled", "o1",
                               json{{"order_number", "ORD-1"}},
                               "2024-05-03T00:00:00Z"));

    runner.assertEquals("cancelOrder:ORD-1", dal.calls.back(), "by number");
    runner.assertEquals("cancelled", dal.findOrder("o1")->status, "status");
    runner.assertTrue(dal.cancellations.back().eventTimestamp.has_value(),
                      "bookkeeping passed");

    runner.assertThrows<PayloadFieldError>(
        [&] {
          deliver(consumer,
                  envelope("order.cancelled", "o1", json::object()));
        },
        "order number required");
  });

  runner.runTest("Order item missing its snapshot is rejected", [&]() {
    RecordingOrderDAL dal;
    OrderConsumer consumer(dal);
    json data = orderSnapshot();
    data["items"][1].erase("product_snapshot");
    try {
      deliver(consumer, envelope("order.created", "o1", data));
      runner.assertTrue(false, "should throw");
    } catch (const PayloadFieldError &e) {
      runner.assertEquals("items[1].product_snapshot", e.field(), "path");
    }
    runner.assertEquals(0, dal.calls.size(), "nothing written");
  });

  runner.runTest("Post media and link preview", [&]() {
    RecordingPostDAL dal;
    PostConsumer consumer(dal);
    deliver(consumer, envelope("post.created", "p1", postSnapshot()));

    auto post = dal.findPost("p1");
    runner.assertFalse(post->mediaJson.has_value(), "empty media is NULL");
    runner.assertFalse(post->linkUrl.has_value(), "null link preview");
    runner.assertEquals(3, post->likeCount, "stats");
    runner.assertTrue(post->engagementRate == 0.5, "engagement rate");
    runner.assertEquals("2024-05-01T10:00:00.000000Z",
                        TimeUtils::formatIsoUtc(*post->lastCommentAt),
                        "stats timestamp parsed with its offset");
    runner.assertFalse(post->publishedAt.has_value(), "null published_at");

    json withMedia = postSnapshot();
    withMedia["media"] = json::parse(R"([{"url": "a.png", "type": "image"}])");
    withMedia["link_preview"] = json{{"url", "https://x.io"}, {"title", "X"}};
    deliver(consumer, envelope("post.published", "p1", withMedia));
    post = dal.findPost("p1");
    runner.assertEquals("a.png",
                        json::parse(post->mediaJson.value_or("[]"))[0]["url"]
                            .get<std::string>(),
                        "media as JSON");
    runner.assertEquals("https://x.io", post->linkUrl.value_or(""), "link");

    deliver(consumer, envelope("post.deleted", "p1", json{{"post_id", "p1"}}));
    runner.assertEquals(0, dal.countActivePosts(), "soft deleted");
    runner.assertTrue(dal.findPost("p1").has_value(), "still queryable");
  });

  runner.runTest("Database failures propagate out of the handler", [&]() {
    RecordingUserDAL dal;
    dal.failWrites = true;
    UserConsumer consumer(dal);
    runner.assertThrows<std::runtime_error>(
        [&] { deliver(consumer, envelope("user.created", "u1", userSnapshot())); },
        "write failure surfaces");
  });

  Logger::shutdown();
  runner.printSummary();
  return 0;
}
