#include "consumers/OrderConsumer.h"
#include "core/logger.h"

using namespace JsonUtils;

std::map<EventKind, EventHandler> OrderConsumer::getHandlers() {
  std::map<EventKind, EventHandler> handlers;
  for (EventKind kind : TopicRouter::kindsOf(Domain::ORDER)) {
    switch (kind) {
    case EventKind::ORDER_CREATED:
      handlers[kind] = [this](const EventEnvelope &event) {
        handleCreated(event);
      };
      break;
    case EventKind::ORDER_CANCELLED:
      handlers[kind] = [this](const EventEnvelope &event) {
        handleCancelled(event);
      };
      break;
    case EventKind::USER_CREATED:
    case EventKind::USER_UPDATED:
    case EventKind::USER_DELETED:
    case EventKind::SUPPLIER_CREATED:
    case EventKind::SUPPLIER_UPDATED:
    case EventKind::SUPPLIER_DELETED:
    case EventKind::PRODUCT_CREATED:
    case EventKind::PRODUCT_UPDATED:
    case EventKind::PRODUCT_PUBLISHED:
    case EventKind::PRODUCT_DISCONTINUED:
    case EventKind::PRODUCT_OUT_OF_STOCK:
    case EventKind::PRODUCT_RESTORED:
    case EventKind::PRODUCT_DELETED:
    case EventKind::POST_CREATED:
    case EventKind::POST_UPDATED:
    case EventKind::POST_PUBLISHED:
    case EventKind::POST_DELETED:
      break;
    }
  }
  return handlers;
}

OrderItemRow OrderConsumer::flattenItem(const json &item, size_t index) {
  const std::string context = "items[" + std::to_string(index) + "]";
  const json &snapshot =
      requireObject(item, "product_snapshot", context);
  const std::string snapshotContext = context + ".product_snapshot";

  OrderItemRow row;
  row.itemId = requireString(item, "item_id", context);
  row.productId = requireString(snapshot, "product_id", snapshotContext);
  row.supplierId = requireString(snapshot, "supplier_id", snapshotContext);
  row.productName = string(snapshot, "product_name");
  row.variantName = string(snapshot, "variant_name");
  row.variantAttributesJson = object(snapshot, "variant_attributes").dump();
  row.imageUrl = string(snapshot, "image_url");
  row.supplierName = string(snapshot, "supplier_name");
  row.quantity = requireInteger(item, "quantity", context);
  row.unitPriceCents = requireInteger(item, "unit_price_cents", context);
  row.finalPriceCents = requireInteger(item, "final_price_cents", context);
  row.totalCents = requireInteger(item, "total_cents", context);
  row.fulfillmentStatus = string(item, "fulfillment_status").value_or("pending");
  row.shippedQuantity = integer(item, "shipped_quantity").value_or(0);
  row.trackingNumber = string(item, "tracking_number");
  row.carrier = string(item, "carrier");
  row.shippedAt = timestamp(item, "shipped_at");
  row.deliveredAt = timestamp(item, "delivered_at");
  return row;
}

FlattenedOrder OrderConsumer::flatten(const EventEnvelope &event) {
  const json &data = event.data();
  const json &customer = object(data, "customer");
  const json &shipping = object(data, "shipping_address");

  FlattenedOrder result;
  OrderRow &row = result.order;
  row.orderId = event.entityId();
  row.orderNumber = requireString(data, "order_number");
  row.customerUserId = requireString(customer, "user_id", "customer");
  row.customerDisplayName = string(customer, "display_name");
  row.customerEmail = string(customer, "email");
  row.customerPhone = string(customer, "phone");
  row.shippingRecipientName = string(shipping, "recipient_name");
  row.shippingPhone = string(shipping, "phone");
  row.shippingStreet1 = string(shipping, "street_address_1");
  row.shippingStreet2 = string(shipping, "street_address_2");
  row.shippingCity = string(shipping, "city");
  row.shippingState = string(shipping, "state");
  row.shippingZipCode = string(shipping, "zip_code");
  row.shippingCountry = string(shipping, "country");
  row.status = requireString(data, "status");
  row.createdAt = requireTimestamp(data, "created_at");
  row.updatedAt = requireTimestamp(data, "updated_at");
  row.event = bookkeepingOf(event);

  const json &items = array(data, "items");
  for (size_t i = 0; i < items.size(); ++i) {
    if (!items[i].is_object()) {
      throw PayloadFieldError("items[" + std::to_string(i) + "]",
                              "expected an object");
    }
    result.items.push_back(flattenItem(items[i], i));
  }
  return result;
}

void OrderConsumer::handleCreated(const EventEnvelope &event) {
  FlattenedOrder flat = flatten(event);
  dal_.upsertOrder(flat.order);
  if (!flat.items.empty()) {
    dal_.upsertOrderItems(flat.order.orderId, flat.items, flat.order.event);
  }
  Logger::info(LogCategory::HANDLER, "OrderConsumer",
               "[ORDER_CREATED] " + event.entityId() + " (" +
                   std::to_string(flat.items.size()) + " items)");
}

void OrderConsumer::handleCancelled(const EventEnvelope &event) {
  std::string orderNumber = requireString(event.data(), "order_number");
  bool found = dal_.cancelOrder(orderNumber, bookkeepingOf(event));
  Logger::info(LogCategory::HANDLER, "OrderConsumer",
               "[ORDER_CANCELLED] " + event.entityId() + " (" + orderNumber +
                   (found ? ")" : ", not replicated)"));
}
