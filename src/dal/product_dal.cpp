#include "dal/product_dal.h"
#include "core/logger.h"
#include "dal/dal_support.h"

using namespace DalSupport;

void ProductDAL::upsertProduct(const ProductRow &row) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(row.productId);
    p.append(row.supplierId);
    p.append(row.supplierName);
    p.append(row.name);
    p.append(row.shortDescription);
    p.append(row.category);
    p.append(row.unitType);
    p.append(row.baseSku);
    p.append(row.brand);
    p.append(row.basePriceCents);
    p.append(row.status);
    p.append(row.viewCount);
    p.append(row.favoriteCount);
    p.append(row.purchaseCount);
    p.append(row.totalReviews);
    p.append(toSql(row.publishedAt));
    p.append(toSql(row.createdAt));
    p.append(toSql(row.updatedAt));
    appendBookkeeping(p, row.event);

    txn.exec(pqxx::zview(
                 "INSERT INTO analytics.products (product_id, supplier_id, "
                 "supplier_name, name, short_description, category, "
                 "unit_type, base_sku, brand, base_price_cents, status, "
                 "view_count, favorite_count, purchase_count, total_reviews, "
                 "published_at, created_at, updated_at, event_id, "
                 "event_timestamp) "
                 "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, "
                 "$13, $14, $15, $16::timestamptz, $17::timestamptz, "
                 "$18::timestamptz, $19, $20::timestamptz) "
                 "ON CONFLICT (product_id) DO UPDATE SET "
                 "supplier_id = EXCLUDED.supplier_id, "
                 "supplier_name = EXCLUDED.supplier_name, "
                 "name = EXCLUDED.name, "
                 "short_description = EXCLUDED.short_description, "
                 "category = EXCLUDED.category, "
                 "unit_type = EXCLUDED.unit_type, "
                 "base_sku = EXCLUDED.base_sku, brand = EXCLUDED.brand, "
                 "base_price_cents = EXCLUDED.base_price_cents, "
                 "status = EXCLUDED.status, "
                 "view_count = EXCLUDED.view_count, "
                 "favorite_count = EXCLUDED.favorite_count, "
                 "purchase_count = EXCLUDED.purchase_count, "
                 "total_reviews = EXCLUDED.total_reviews, "
                 "published_at = EXCLUDED.published_at, "
                 "updated_at = EXCLUDED.updated_at, "
                 "event_id = EXCLUDED.event_id, "
                 "event_timestamp = EXCLUDED.event_timestamp"),
             p);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "ProductDAL",
                  "upsertProduct " + row.productId + " failed: " + e.what());
    throw;
  }
}

void ProductDAL::replaceVariants(const std::string &productId,
                                 const std::vector<ProductVariantRow> &variants) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params del;
    del.append(productId);
    txn.exec(pqxx::zview(
                 "DELETE FROM analytics.product_variants WHERE product_id = $1"),
             del);

    for (const auto &v : variants) {
      pqxx::params p;
      p.append(productId);
      p.append(v.variantKey);
      p.append(v.variantId);
      p.append(v.variantName);
      p.append(v.attributesJson);
      p.append(v.priceCents);
      p.append(v.costCents);
      p.append(v.quantity);
      p.append(v.widthCm);
      p.append(v.heightCm);
      p.append(v.depthCm);
      p.append(v.imageUrl);

      txn.exec(pqxx::zview(
                   "INSERT INTO analytics.product_variants (product_id, "
                   "variant_key, variant_id, variant_name, attributes_json, "
                   "price_cents, cost_cents, quantity, width_cm, height_cm, "
                   "depth_cm, image_url) "
                   "VALUES ($1, $2, $3, $4, $5::jsonb, $6, $7, $8, $9, $10, "
                   "$11, $12)"),
               p);
    }

    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "ProductDAL",
                  "replaceVariants " + productId + " (" +
                      std::to_string(variants.size()) +
                      " variants) failed: " + e.what());
    throw;
  }
}

void ProductDAL::deleteProduct(const std::string &productId) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(productId);
    auto result = txn.exec(
        pqxx::zview("DELETE FROM analytics.products WHERE product_id = $1"), p);
    txn.commit();

    if (result.affected_rows() == 0) {
      Logger::debug(LogCategory::DATABASE, "ProductDAL",
                    "deleteProduct: " + productId + " already absent");
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "ProductDAL",
                  "deleteProduct " + productId + " failed: " + e.what());
    throw;
  }
}

std::optional<ProductRow> ProductDAL::findProduct(const std::string &productId) {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());

  pqxx::params p;
  p.append(productId);
  const std::string sql =
      "SELECT product_id, supplier_id, supplier_name, name, "
      "short_description, category, unit_type, base_sku, brand, "
      "base_price_cents, status, view_count, favorite_count, purchase_count, "
      "total_reviews, " +
      utcColumn("published_at") + ", " + utcColumn("created_at") + ", " +
      utcColumn("updated_at") + ", event_id, " + utcColumn("event_timestamp") +
      " FROM analytics.products WHERE product_id = $1";
  auto result = txn.exec(pqxx::zview(sql), p);
  if (result.empty())
    return std::nullopt;

  const auto &r = result[0];
  ProductRow row;
  row.productId = r[0].as<std::string>();
  row.supplierId = r[1].as<std::string>();
  row.supplierName = readText(r[2]);
  row.name = r[3].as<std::string>();
  row.shortDescription = readText(r[4]);
  row.category = r[5].as<std::string>();
  row.unitType = r[6].as<std::string>();
  row.baseSku = readText(r[7]);
  row.brand = readText(r[8]);
  row.basePriceCents = r[9].as<int64_t>();
  row.status = r[10].as<std::string>();
  row.viewCount = readInt(r[11]).value_or(0);
  row.favoriteCount = readInt(r[12]).value_or(0);
  row.purchaseCount = readInt(r[13]).value_or(0);
  row.totalReviews = readInt(r[14]).value_or(0);
  row.publishedAt = readTimestamp(r[15]);
  row.createdAt = readRequiredTimestamp(r[16]);
  row.updatedAt = readRequiredTimestamp(r[17]);
  row.event.eventId = readText(r[18]);
  row.event.eventTimestamp = readTimestamp(r[19]);
  return row;
}

std::vector<ProductVariantRow>
ProductDAL::listVariants(const std::string &productId) {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());

  pqxx::params p;
  p.append(productId);
  auto result = txn.exec(
      pqxx::zview("SELECT variant_key, variant_id, variant_name, "
                  "attributes_json::text, price_cents, cost_cents, quantity, "
                  "width_cm, height_cm, depth_cm, image_url "
                  "FROM analytics.product_variants WHERE product_id = $1 "
                  "ORDER BY variant_key"),
      p);

  std::vector<ProductVariantRow> variants;
  for (const auto &r : result) {
    ProductVariantRow v;
    v.variantKey = r[0].as<std::string>();
    v.variantId = r[1].as<std::string>();
    v.variantName = r[2].as<std::string>();
    v.attributesJson = readText(r[3]);
    v.priceCents = r[4].as<int64_t>();
    v.costCents = readInt(r[5]);
    v.quantity = readInt(r[6]).value_or(0);
    v.widthCm = readDouble(r[7]);
    v.heightCm = readDouble(r[8]);
    v.depthCm = readDouble(r[9]);
    v.imageUrl = readText(r[10]);
    variants.push_back(std::move(v));
  }
  return variants;
}

std::vector<std::string>
ProductDAL::listVariantKeys(const std::string &productId) {
  std::vector<std::string> keys;
  for (const auto &variant : listVariants(productId))
    keys.push_back(variant.variantKey);
  return keys;
}
