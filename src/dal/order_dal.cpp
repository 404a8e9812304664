#include "dal/order_dal.h"
#include "core/logger.h"
#include "dal/dal_support.h"

using namespace DalSupport;

void OrderDAL::upsertOrder(const OrderRow &row) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(row.orderId);
    p.append(row.orderNumber);
    p.append(row.customerUserId);
    p.append(row.customerDisplayName);
    p.append(row.customerEmail);
    p.append(row.customerPhone);
    p.append(row.shippingRecipientName);
    p.append(row.shippingPhone);
    p.append(row.shippingStreet1);
    p.append(row.shippingStreet2);
    p.append(row.shippingCity);
    p.append(row.shippingState);
    p.append(row.shippingZipCode);
    p.append(row.shippingCountry);
    p.append(row.status);
    p.append(toSql(row.createdAt));
    p.append(toSql(row.updatedAt));
    appendBookkeeping(p, row.event);

    auto result = txn.exec(
        pqxx::zview(
            "INSERT INTO analytics.orders (order_id, order_number, "
            "customer_user_id, customer_display_name, customer_email, "
            "customer_phone, shipping_recipient_name, shipping_phone, "
            "shipping_street_1, shipping_street_2, shipping_city, "
            "shipping_state, shipping_zip_code, shipping_country, status, "
            "created_at, updated_at, event_id, event_timestamp) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, "
            "$14, $15, $16::timestamptz, $17::timestamptz, $18, "
            "$19::timestamptz) "
            "ON CONFLICT (order_id) DO UPDATE SET "
            "status = EXCLUDED.status, updated_at = EXCLUDED.updated_at, "
            "event_id = EXCLUDED.event_id, "
            "event_timestamp = EXCLUDED.event_timestamp "
            "WHERE analytics.orders.event_timestamp IS NULL "
            "OR EXCLUDED.event_timestamp IS NULL "
            "OR EXCLUDED.event_timestamp >= analytics.orders.event_timestamp"),
        p);
    txn.commit();

    if (result.affected_rows() == 0) {
      Logger::info(LogCategory::DATABASE, "OrderDAL",
                   "upsertOrder " + row.orderId +
                       ": stored row is newer, event ignored");
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "OrderDAL",
                  "upsertOrder " + row.orderId + " failed: " + e.what());
    throw;
  }
}

void OrderDAL::upsertOrderItems(const std::string &orderId,
                                const std::vector<OrderItemRow> &items,
                                const EventBookkeeping &event) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    for (const auto &item : items) {
      pqxx::params p;
      p.append(orderId);
      p.append(item.itemId);
      p.append(item.productId);
      p.append(item.supplierId);
      p.append(item.productName);
      p.append(item.variantName);
      p.append(item.variantAttributesJson);
      p.append(item.imageUrl);
      p.append(item.supplierName);
      p.append(item.quantity);
      p.append(item.unitPriceCents);
      p.append(item.finalPriceCents);
      p.append(item.totalCents);
      p.append(item.fulfillmentStatus);
      p.append(item.shippedQuantity);
      p.append(item.trackingNumber);
      p.append(item.carrier);
      p.append(toSql(item.shippedAt));
      p.append(toSql(item.deliveredAt));
      appendBookkeeping(p, event);

      txn.exec(
          pqxx::zview(
              "INSERT INTO analytics.order_items (order_id, item_id, "
              "product_id, supplier_id, product_name, variant_name, "
              "variant_attributes_json, image_url, supplier_name, quantity, "
              "unit_price_cents, final_price_cents, total_cents, "
              "fulfillment_status, shipped_quantity, tracking_number, "
              "carrier, shipped_at, delivered_at, event_id, event_timestamp) "
              "VALUES ($1, $2, $3, $4, $5, $6, $7::jsonb, $8, $9, $10, $11, "
              "$12, $13, $14, $15, $16, $17, $18::timestamptz, "
              "$19::timestamptz, $20, $21::timestamptz) "
              "ON CONFLICT (order_id, item_id) DO UPDATE SET "
              "fulfillment_status = EXCLUDED.fulfillment_status, "
              "shipped_quantity = EXCLUDED.shipped_quantity, "
              "tracking_number = EXCLUDED.tracking_number, "
              "carrier = EXCLUDED.carrier, "
              "shipped_at = EXCLUDED.shipped_at, "
              "delivered_at = EXCLUDED.delivered_at, "
              "event_id = EXCLUDED.event_id, "
              "event_timestamp = EXCLUDED.event_timestamp "
              "WHERE analytics.order_items.event_timestamp IS NULL "
              "OR EXCLUDED.event_timestamp IS NULL "
              "OR EXCLUDED.event_timestamp >= "
              "analytics.order_items.event_timestamp"),
          p);
    }

    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "OrderDAL",
                  "upsertOrderItems " + orderId + " (" +
                      std::to_string(items.size()) + " items) failed: " +
                      e.what());
    throw;
  }
}

bool OrderDAL::cancelOrder(const std::string &orderNumber,
                           const EventBookkeeping &event) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(orderNumber);
    appendBookkeeping(p, event);

    auto result = txn.exec(
        pqxx::zview("UPDATE analytics.orders SET status = 'cancelled', "
                    "event_id = $2, event_timestamp = $3::timestamptz "
                    "WHERE order_number = $1 AND (event_timestamp IS NULL "
                    "OR $3::timestamptz IS NULL "
                    "OR $3::timestamptz >= event_timestamp)"),
        p);

    bool updated = result.affected_rows() > 0;
    bool exists = updated;
    if (!updated) {
      pqxx::params q;
      q.append(orderNumber);
      exists = !txn.exec(pqxx::zview("SELECT 1 FROM analytics.orders "
                                     "WHERE order_number = $1"),
                         q)
                    .empty();
    }
    txn.commit();

    if (!exists) {
      Logger::warning(LogCategory::DATABASE, "OrderDAL",
                      "cancelOrder: no order with number " + orderNumber);
    } else if (!updated) {
      Logger::info(LogCategory::DATABASE, "OrderDAL",
                   "cancelOrder " + orderNumber +
                       ": stored row is newer, event ignored");
    }
    return exists;
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "OrderDAL",
                  "cancelOrder " + orderNumber + " failed: " + e.what());
    throw;
  }
}

std::optional<OrderRow> OrderDAL::findOrder(const std::string &orderId) {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());

  pqxx::params p;
  p.append(orderId);
  const std::string sql =
      "SELECT order_id, order_number, customer_user_id, "
      "customer_display_name, customer_email, customer_phone, "
      "shipping_recipient_name, shipping_phone, shipping_street_1, "
      "shipping_street_2, shipping_city, shipping_state, shipping_zip_code, "
      "shipping_country, status, " +
      utcColumn("created_at") + ", " + utcColumn("updated_at") +
      ", event_id, " + utcColumn("event_timestamp") +
      " FROM analytics.orders WHERE order_id = $1";
  auto result = txn.exec(pqxx::zview(sql), p);
  if (result.empty())
    return std::nullopt;

  const auto &r = result[0];
  OrderRow row;
  row.orderId = r[0].as<std::string>();
  row.orderNumber = r[1].as<std::string>();
  row.customerUserId = r[2].as<std::string>();
  row.customerDisplayName = readText(r[3]);
  row.customerEmail = readText(r[4]);
  row.customerPhone = readText(r[5]);
  row.shippingRecipientName = readText(r[6]);
  row.shippingPhone = readText(r[7]);
  row.shippingStreet1 = readText(r[8]);
  row.shippingStreet2 = readText(r[9]);
  row.shippingCity = readText(r[10]);
  row.shippingState = readText(r[11]);
  row.shippingZipCode = readText(r[12]);
  row.shippingCountry = readText(r[13]);
  row.status = r[14].as<std::string>();
  row.createdAt = readRequiredTimestamp(r[15]);
  row.updatedAt = readRequiredTimestamp(r[16]);
  row.event.eventId = readText(r[17]);
  row.event.eventTimestamp = readTimestamp(r[18]);
  return row;
}

std::vector<OrderItemRow>
OrderDAL::findOrderItems(const std::string &orderId) {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());

  pqxx::params p;
  p.append(orderId);
  const std::string sql =
      "SELECT item_id, product_id, supplier_id, product_name, variant_name, "
      "variant_attributes_json::text, image_url, supplier_name, quantity, "
      "unit_price_cents, final_price_cents, total_cents, fulfillment_status, "
      "shipped_quantity, tracking_number, carrier, " +
      utcColumn("shipped_at") + ", " + utcColumn("delivered_at") +
      " FROM analytics.order_items WHERE order_id = $1 ORDER BY item_id";
  auto result = txn.exec(pqxx::zview(sql), p);

  std::vector<OrderItemRow> items;
  for (const auto &r : result) {
    OrderItemRow item;
    item.itemId = r[0].as<std::string>();
    item.productId = r[1].as<std::string>();
    item.supplierId = r[2].as<std::string>();
    item.productName = readText(r[3]);
    item.variantName = readText(r[4]);
    item.variantAttributesJson = readText(r[5]);
    item.imageUrl = readText(r[6]);
    item.supplierName = readText(r[7]);
    item.quantity = r[8].as<int64_t>();
    item.unitPriceCents = r[9].as<int64_t>();
    item.finalPriceCents = r[10].as<int64_t>();
    item.totalCents = r[11].as<int64_t>();
    item.fulfillmentStatus = readText(r[12]).value_or("pending");
    item.shippedQuantity = readInt(r[13]).value_or(0);
    item.trackingNumber = readText(r[14]);
    item.carrier = readText(r[15]);
    item.shippedAt = readTimestamp(r[16]);
    item.deliveredAt = readTimestamp(r[17]);
    items.push_back(std::move(item));
  }
  return items;
}

void OrderDAL::deleteOrder(const std::string &orderId) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(orderId);
    txn.exec(pqxx::zview("DELETE FROM analytics.orders WHERE order_id = $1"),
             p);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "OrderDAL",
                  "deleteOrder " + orderId + " failed: " + e.what());
    throw;
  }
}
