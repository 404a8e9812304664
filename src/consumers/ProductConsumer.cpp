#include "consumers/ProductConsumer.h"
#include "core/logger.h"

using namespace JsonUtils;

std::map<EventKind, EventHandler> ProductConsumer::getHandlers() {
  std::map<EventKind, EventHandler> handlers;
  for (EventKind kind : TopicRouter::kindsOf(Domain::PRODUCT)) {
    switch (kind) {
    case EventKind::PRODUCT_CREATED:
    case EventKind::PRODUCT_UPDATED:
    case EventKind::PRODUCT_PUBLISHED:
    case EventKind::PRODUCT_DISCONTINUED:
    case EventKind::PRODUCT_OUT_OF_STOCK:
    case EventKind::PRODUCT_RESTORED:
      handlers[kind] = [this, kind](const EventEnvelope &event) {
        handleUpsert(kind, event);
      };
      break;
    case EventKind::PRODUCT_DELETED:
      handlers[kind] = [this](const EventEnvelope &event) {
        handleDeleted(event);
      };
      break;
    case EventKind::USER_CREATED:
    case EventKind::USER_UPDATED:
    case EventKind::USER_DELETED:
    case EventKind::SUPPLIER_CREATED:
    case EventKind::SUPPLIER_UPDATED:
    case EventKind::SUPPLIER_DELETED:
    case EventKind::ORDER_CREATED:
    case EventKind::ORDER_CANCELLED:
    case EventKind::POST_CREATED:
    case EventKind::POST_UPDATED:
    case EventKind::POST_PUBLISHED:
    case EventKind::POST_DELETED:
      break;
    }
  }
  return handlers;
}

ProductVariantRow ProductConsumer::flattenVariant(const std::string &variantKey,
                                                  const json &variant) {
  const std::string context = "variants." + variantKey;
  const json &dimensions = object(variant, "package_dimensions");

  ProductVariantRow row;
  row.variantKey = variantKey;
  row.variantId = requireString(variant, "variant_id", context);
  row.variantName = requireString(variant, "variant_name", context);
  row.attributesJson = jsonText(variant, "attributes");
  row.priceCents = requireInteger(variant, "price_cents", context);
  row.costCents = integer(variant, "cost_cents");
  row.quantity = integer(variant, "quantity").value_or(0);
  row.widthCm = number(dimensions, "width_cm");
  row.heightCm = number(dimensions, "height_cm");
  row.depthCm = number(dimensions, "depth_cm");
  row.imageUrl = string(variant, "image_url");
  return row;
}

FlattenedProduct ProductConsumer::flatten(const EventEnvelope &event) {
  const json &data = event.data();
  const json &supplierInfo = object(data, "supplier_info");
  const json &metadata = object(data, "metadata");
  const json &stats = object(data, "stats");

  FlattenedProduct result;
  ProductRow &row = result.product;
  row.productId = event.entityId();
  row.supplierId = requireString(data, "supplier_id");
  row.supplierName = string(supplierInfo, "legal_name");
  row.name = requireString(data, "name");
  row.shortDescription = string(data, "short_description");
  row.category = requireString(data, "category");
  row.unitType = requireString(data, "unit_type");
  row.baseSku = string(metadata, "base_sku");
  row.brand = string(metadata, "brand");
  row.basePriceCents = requireInteger(data, "base_price_cents");
  row.status = requireString(data, "status");
  row.viewCount = integer(stats, "view_count").value_or(0);
  row.favoriteCount = integer(stats, "favorite_count").value_or(0);
  row.purchaseCount = integer(stats, "purchase_count").value_or(0);
  row.totalReviews = integer(stats, "total_reviews").value_or(0);
  row.publishedAt = timestamp(data, "published_at");
  row.createdAt = requireTimestamp(data, "created_at");
  row.updatedAt = requireTimestamp(data, "updated_at");
  row.event = bookkeepingOf(event);

  result.variantsPresent = isPresent(data, "variants");
  if (result.variantsPresent && !data["variants"].is_object()) {
    throw PayloadFieldError("variants", "expected an object keyed by variant");
  }
  const json &variants = object(data, "variants");
  for (auto it = variants.begin(); it != variants.end(); ++it) {
    if (!it.value().is_object()) {
      throw PayloadFieldError("variants." + it.key(), "expected an object");
    }
    result.variants.push_back(flattenVariant(it.key(), it.value()));
  }
  return result;
}

void ProductConsumer::handleUpsert(EventKind kind, const EventEnvelope &event) {
  FlattenedProduct flat = flatten(event);
  dal_.upsertProduct(flat.product);
  if (!flat.variantsPresent) {
    Logger::info(LogCategory::HANDLER, "ProductConsumer",
                 "[" + TopicRouter::traceLabel(kind) + "] " +
                     event.entityId() + " (variants unchanged)");
    return;
  }
  dal_.replaceVariants(flat.product.productId, flat.variants);
  Logger::info(LogCategory::HANDLER, "ProductConsumer",
               "[" + TopicRouter::traceLabel(kind) + "] " + event.entityId() +
                   " (" + std::to_string(flat.variants.size()) +
                   " variants)");
}

void ProductConsumer::handleDeleted(const EventEnvelope &event) {
  std::string productId = deletedEntityId(event, Domain::PRODUCT);
  dal_.deleteProduct(productId);
  Logger::info(LogCategory::HANDLER, "ProductConsumer",
               "[PRODUCT_DELETED] " + productId);
}
