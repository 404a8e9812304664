#include "db/schema_bootstrap.h"
#include "core/errors.h"
#include "core/logger.h"
#include <pqxx/pqxx>
#include <set>

namespace {

const char *const kUsersTable = R"SQL(
CREATE TABLE IF NOT EXISTS analytics.users (
    user_id         VARCHAR(24) PRIMARY KEY,
    email           VARCHAR(255) NOT NULL,
    phone           VARCHAR(50),
    display_name    VARCHAR(100) NOT NULL,
    avatar          TEXT,
    bio             VARCHAR(500),
    version         INTEGER DEFAULT 1,
    deleted_at      TIMESTAMPTZ,
    created_at      TIMESTAMPTZ NOT NULL,
    updated_at      TIMESTAMPTZ NOT NULL,
    event_id        VARCHAR(36),
    event_timestamp TIMESTAMPTZ
))SQL";

const char *const kSuppliersTable = R"SQL(
CREATE TABLE IF NOT EXISTS analytics.suppliers (
    supplier_id          VARCHAR(24) PRIMARY KEY,
    email                VARCHAR(255) NOT NULL,
    primary_phone        VARCHAR(50) NOT NULL,
    contact_person_name  VARCHAR(200),
    contact_person_title VARCHAR(200),
    contact_person_email VARCHAR(255),
    contact_person_phone VARCHAR(50),
    legal_name           VARCHAR(200) NOT NULL,
    dba_name             VARCHAR(200),
    street_address_1     VARCHAR(200),
    street_address_2     VARCHAR(200),
    city                 VARCHAR(100),
    state                VARCHAR(100),
    zip_code             VARCHAR(20),
    country              VARCHAR(2),
    support_email        VARCHAR(255),
    support_phone        VARCHAR(50),
    facebook_url         TEXT,
    instagram_handle     VARCHAR(100),
    twitter_handle       VARCHAR(100),
    linkedin_url         TEXT,
    timezone             VARCHAR(50),
    created_at           TIMESTAMPTZ NOT NULL,
    updated_at           TIMESTAMPTZ NOT NULL,
    event_id             VARCHAR(36),
    event_timestamp      TIMESTAMPTZ
))SQL";

const char *const kProductsTable = R"SQL(
CREATE TABLE IF NOT EXISTS analytics.products (
    product_id        VARCHAR(24) PRIMARY KEY,
    supplier_id       VARCHAR(24) NOT NULL,
    supplier_name     VARCHAR(200),
    name              VARCHAR(200) NOT NULL,
    short_description VARCHAR(500),
    category          VARCHAR(50) NOT NULL,
    unit_type         VARCHAR(20) NOT NULL,
    base_sku          VARCHAR(100),
    brand             VARCHAR(100),
    base_price_cents  INTEGER NOT NULL,
    status            VARCHAR(20) NOT NULL,
    view_count        INTEGER DEFAULT 0,
    favorite_count    INTEGER DEFAULT 0,
    purchase_count    INTEGER DEFAULT 0,
    total_reviews     INTEGER DEFAULT 0,
    published_at      TIMESTAMPTZ,
    created_at        TIMESTAMPTZ NOT NULL,
    updated_at        TIMESTAMPTZ NOT NULL,
    event_id          VARCHAR(36),
    event_timestamp   TIMESTAMPTZ
))SQL";

const char *const kProductVariantsTable = R"SQL(
CREATE TABLE IF NOT EXISTS analytics.product_variants (
    id              BIGSERIAL PRIMARY KEY,
    product_id      VARCHAR(24) NOT NULL
                    REFERENCES analytics.products(product_id) ON DELETE CASCADE,
    variant_key     VARCHAR(200) NOT NULL,
    variant_id      VARCHAR(100) NOT NULL,
    variant_name    VARCHAR(200) NOT NULL,
    attributes_json JSONB,
    price_cents     INTEGER NOT NULL,
    cost_cents      INTEGER,
    quantity        INTEGER DEFAULT 0,
    width_cm        DOUBLE PRECISION,
    height_cm       DOUBLE PRECISION,
    depth_cm        DOUBLE PRECISION,
    image_url       TEXT,
    CONSTRAINT uq_product_variant UNIQUE (product_id, variant_key)
))SQL";

const char *const kOrdersTable = R"SQL(
CREATE TABLE IF NOT EXISTS analytics.orders (
    order_id                VARCHAR(24) PRIMARY KEY,
    order_number            VARCHAR(50) NOT NULL,
    customer_user_id        VARCHAR(24) NOT NULL,
    customer_display_name   VARCHAR(200),
    customer_email          VARCHAR(255),
    customer_phone          VARCHAR(50),
    shipping_recipient_name VARCHAR(200),
    shipping_phone          VARCHAR(50),
    shipping_street_1       VARCHAR(200),
    shipping_street_2       VARCHAR(200),
    shipping_city           VARCHAR(100),
    shipping_state          VARCHAR(100),
    shipping_zip_code       VARCHAR(20),
    shipping_country        VARCHAR(2),
    status                  VARCHAR(20) NOT NULL,
    created_at              TIMESTAMPTZ NOT NULL,
    updated_at              TIMESTAMPTZ NOT NULL,
    event_id                VARCHAR(36),
    event_timestamp         TIMESTAMPTZ,
    CONSTRAINT uq_order_number UNIQUE (order_number)
))SQL";

const char *const kOrderItemsTable = R"SQL(
CREATE TABLE IF NOT EXISTS analytics.order_items (
    id                      BIGSERIAL PRIMARY KEY,
    order_id                VARCHAR(24) NOT NULL
                            REFERENCES analytics.orders(order_id) ON DELETE CASCADE,
    item_id                 VARCHAR(50) NOT NULL,
    product_id              VARCHAR(24) NOT NULL,
    supplier_id             VARCHAR(24) NOT NULL,
    product_name            VARCHAR(200),
    variant_name            VARCHAR(200),
    variant_attributes_json JSONB,
    image_url               TEXT,
    supplier_name           VARCHAR(200),
    quantity                INTEGER NOT NULL,
    unit_price_cents        INTEGER NOT NULL,
    final_price_cents       INTEGER NOT NULL,
    total_cents             INTEGER NOT NULL,
    fulfillment_status      VARCHAR(20),
    shipped_quantity        INTEGER DEFAULT 0,
    tracking_number         VARCHAR(100),
    carrier                 VARCHAR(100),
    shipped_at              TIMESTAMPTZ,
    delivered_at            TIMESTAMPTZ,
    event_id                VARCHAR(36),
    event_timestamp         TIMESTAMPTZ,
    CONSTRAINT uq_order_item UNIQUE (order_id, item_id)
))SQL";

const char *const kPostsTable = R"SQL(
CREATE TABLE IF NOT EXISTS analytics.posts (
    post_id             VARCHAR(24) PRIMARY KEY,
    post_type           VARCHAR(20) NOT NULL,
    author_user_id      VARCHAR(24) NOT NULL,
    author_display_name VARCHAR(200),
    author_avatar       TEXT,
    author_type         VARCHAR(20),
    text_content        TEXT,
    media_json          JSONB,
    link_url            TEXT,
    link_title          VARCHAR(200),
    link_description    VARCHAR(500),
    link_image          TEXT,
    link_site_name      VARCHAR(200),
    view_count          INTEGER DEFAULT 0,
    like_count          INTEGER DEFAULT 0,
    comment_count       INTEGER DEFAULT 0,
    share_count         INTEGER DEFAULT 0,
    save_count          INTEGER DEFAULT 0,
    engagement_rate     DOUBLE PRECISION DEFAULT 0.0,
    last_comment_at     TIMESTAMPTZ,
    deleted_at          TIMESTAMPTZ,
    published_at        TIMESTAMPTZ,
    created_at          TIMESTAMPTZ NOT NULL,
    updated_at          TIMESTAMPTZ NOT NULL,
    event_id            VARCHAR(36),
    event_timestamp     TIMESTAMPTZ
))SQL";

const char *const kLogsTable = R"SQL(
CREATE TABLE IF NOT EXISTS metadata.logs (
    id        BIGSERIAL PRIMARY KEY,
    ts        TIMESTAMPTZ NOT NULL DEFAULT NOW(),
    level     VARCHAR(50) NOT NULL,
    category  VARCHAR(50),
    component VARCHAR(255),
    message   TEXT
))SQL";

} // namespace

SchemaBootstrap::SchemaBootstrap(ConnectionPool &pool)
    : SchemaBootstrap(pool, defaultDefinitions()) {}

SchemaBootstrap::SchemaBootstrap(ConnectionPool &pool,
                                 std::vector<TableDefinition> definitions)
    : pool_(pool), definitions_(std::move(definitions)) {}

std::vector<TableDefinition> SchemaBootstrap::defaultDefinitions() {
  return {
      {"analytics", {"CREATE SCHEMA IF NOT EXISTS analytics"}, {}},
      {"metadata", {"CREATE SCHEMA IF NOT EXISTS metadata"}, {}},
      {"analytics.users",
       {kUsersTable,
        "CREATE INDEX IF NOT EXISTS idx_users_email ON analytics.users (email)",
        "CREATE INDEX IF NOT EXISTS idx_users_created ON analytics.users "
        "(created_at)"},
       {"analytics"}},
      {"analytics.suppliers",
       {kSuppliersTable,
        "CREATE INDEX IF NOT EXISTS idx_suppliers_email ON analytics.suppliers "
        "(email)",
        "CREATE INDEX IF NOT EXISTS idx_suppliers_legal_name ON "
        "analytics.suppliers (legal_name)",
        "CREATE INDEX IF NOT EXISTS idx_suppliers_location ON "
        "analytics.suppliers (country, state, city)"},
       {"analytics"}},
      {"analytics.products",
       {kProductsTable,
        "CREATE INDEX IF NOT EXISTS idx_products_supplier ON analytics.products "
        "(supplier_id)",
        "CREATE INDEX IF NOT EXISTS idx_products_category ON analytics.products "
        "(category)",
        "CREATE INDEX IF NOT EXISTS idx_products_status ON analytics.products "
        "(status)",
        "CREATE INDEX IF NOT EXISTS idx_products_created ON analytics.products "
        "(created_at)"},
       {"analytics"}},
      {"analytics.product_variants",
       {kProductVariantsTable,
        "CREATE INDEX IF NOT EXISTS idx_variants_product ON "
        "analytics.product_variants (product_id)"},
       {"analytics", "analytics.products"}},
      {"analytics.orders",
       {kOrdersTable,
        "CREATE INDEX IF NOT EXISTS idx_orders_customer ON analytics.orders "
        "(customer_user_id)",
        "CREATE INDEX IF NOT EXISTS idx_orders_status ON analytics.orders "
        "(status)",
        "CREATE INDEX IF NOT EXISTS idx_orders_created ON analytics.orders "
        "(created_at)"},
       {"analytics"}},
      {"analytics.order_items",
       {kOrderItemsTable,
        "CREATE INDEX IF NOT EXISTS idx_items_order ON analytics.order_items "
        "(order_id)",
        "CREATE INDEX IF NOT EXISTS idx_items_product ON analytics.order_items "
        "(product_id)"},
       {"analytics", "analytics.orders"}},
      {"analytics.posts",
       {kPostsTable,
        "CREATE INDEX IF NOT EXISTS idx_posts_author ON analytics.posts "
        "(author_user_id)",
        "CREATE INDEX IF NOT EXISTS idx_posts_type ON analytics.posts "
        "(post_type)",
        "CREATE INDEX IF NOT EXISTS idx_posts_published ON analytics.posts "
        "(published_at)",
        "CREATE INDEX IF NOT EXISTS idx_posts_created ON analytics.posts "
        "(created_at)"},
       {"analytics"}},
      {"analytics.active_users",
       {"CREATE OR REPLACE VIEW analytics.active_users AS "
        "SELECT * FROM analytics.users WHERE deleted_at IS NULL"},
       {"analytics.users"}},
      {"analytics.active_posts",
       {"CREATE OR REPLACE VIEW analytics.active_posts AS "
        "SELECT * FROM analytics.posts WHERE deleted_at IS NULL"},
       {"analytics.posts"}},
      {"metadata.logs",
       {kLogsTable,
        "CREATE INDEX IF NOT EXISTS idx_logs_ts ON metadata.logs (ts)"},
       {"metadata"}},
  };
}

void SchemaBootstrap::validateOrdering(
    const std::vector<TableDefinition> &definitions) {
  std::set<std::string> allNames;
  for (const auto &def : definitions) {
    if (!allNames.insert(def.name).second)
      throw SchemaBootstrapError(def.name, "defined more than once");
  }

  std::set<std::string> defined;
  for (const auto &def : definitions) {
    for (const auto &ref : def.references) {
      if (defined.count(ref))
        continue;
      if (allNames.count(ref))
        throw SchemaBootstrapError(def.name,
                                   "references " + ref + " which is defined later");
      throw SchemaBootstrapError(def.name, "references unknown object " + ref);
    }
    defined.insert(def.name);
  }
}

// 42P07 duplicate_table, 42P06 duplicate_schema, 42710 duplicate_object.
bool SchemaBootstrap::isAlreadyExists(const std::string &sqlstate) {
  return sqlstate == "42P07" || sqlstate == "42P06" || sqlstate == "42710";
}

// Each statement runs in its own autocommit step so a tolerated error does
// not abort the statements that follow.
void SchemaBootstrap::run() {
  validateOrdering(definitions_);

  Logger::info(LogCategory::SCHEMA, "SchemaBootstrap",
               "Bootstrapping " + std::to_string(definitions_.size()) +
                   " schema objects");

  ConnectionGuard guard(pool_);
  pqxx::connection &conn = guard.get();

  for (const auto &def : definitions_) {
    for (const auto &statement : def.statements) {
      try {
        pqxx::nontransaction txn(conn);
        txn.exec(statement);
        executed_++;
      } catch (const pqxx::sql_error &e) {
        if (isAlreadyExists(e.sqlstate())) {
          tolerated_++;
          Logger::debug(LogCategory::SCHEMA, "SchemaBootstrap",
                        def.name + " already exists (" + e.sqlstate() + ")");
          continue;
        }
        Logger::critical(LogCategory::SCHEMA, "SchemaBootstrap",
                         "Failed creating " + def.name + " [" + e.sqlstate() +
                             "]: " + e.what());
        throw SchemaBootstrapError(def.name, e.what());
      } catch (const pqxx::broken_connection &e) {
        Logger::critical(LogCategory::SCHEMA, "SchemaBootstrap",
                         "Connection lost creating " + def.name + ": " +
                             e.what());
        throw SchemaBootstrapError(def.name, e.what());
      }
    }
    Logger::debug(LogCategory::SCHEMA, "SchemaBootstrap", "Ready: " + def.name);
  }

  Logger::info(LogCategory::SCHEMA, "SchemaBootstrap",
               "Schema ready (" + std::to_string(executed_) + " executed, " +
                   std::to_string(tolerated_) + " already present)");
}
