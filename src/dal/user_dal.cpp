#include "dal/user_dal.h"
#include "core/logger.h"
#include "dal/dal_support.h"

using namespace DalSupport;

void UserDAL::upsertUser(const UserRow &row) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(row.userId);
    p.append(row.email);
    p.append(row.phone);
    p.append(row.displayName);
    p.append(row.avatar);
    p.append(row.bio);
    p.append(row.version);
    p.append(toSql(row.deletedAt));
    p.append(toSql(row.createdAt));
    p.append(toSql(row.updatedAt));
    appendBookkeeping(p, row.event);

    txn.exec(pqxx::zview(
                 "INSERT INTO analytics.users (user_id, email, phone, "
                 "display_name, avatar, bio, version, deleted_at, created_at, "
                 "updated_at, event_id, event_timestamp) "
                 "VALUES ($1, $2, $3, $4, $5, $6, $7, $8::timestamptz, "
                 "$9::timestamptz, $10::timestamptz, $11, $12::timestamptz) "
                 "ON CONFLICT (user_id) DO UPDATE SET "
                 "email = EXCLUDED.email, phone = EXCLUDED.phone, "
                 "display_name = EXCLUDED.display_name, "
                 "avatar = EXCLUDED.avatar, bio = EXCLUDED.bio, "
                 "version = EXCLUDED.version, "
                 "deleted_at = EXCLUDED.deleted_at, "
                 "updated_at = EXCLUDED.updated_at, "
                 "event_id = EXCLUDED.event_id, "
                 "event_timestamp = EXCLUDED.event_timestamp"),
             p);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "UserDAL",
                  "upsertUser " + row.userId + " failed: " + e.what());
    throw;
  }
}

void UserDAL::softDeleteUser(const std::string &userId,
                             const EventBookkeeping &event) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(userId);
    appendBookkeeping(p, event);

    auto result = txn.exec(
        pqxx::zview("UPDATE analytics.users SET "
                    "deleted_at = COALESCE(deleted_at, $3::timestamptz, NOW()), "
                    "event_id = $2, event_timestamp = $3::timestamptz "
                    "WHERE user_id = $1"),
        p);
    txn.commit();

    if (result.affected_rows() == 0) {
      Logger::warning(LogCategory::DATABASE, "UserDAL",
                      "softDeleteUser: no row for " + userId);
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "UserDAL",
                  "softDeleteUser " + userId + " failed: " + e.what());
    throw;
  }
}

std::optional<UserRow> UserDAL::findUser(const std::string &userId) {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());

  pqxx::params p;
  p.append(userId);
  const std::string sql =
      "SELECT user_id, email, phone, display_name, avatar, bio, version, " +
      utcColumn("deleted_at") + ", " + utcColumn("created_at") + ", " +
      utcColumn("updated_at") + ", event_id, " + utcColumn("event_timestamp") +
      " FROM analytics.users WHERE user_id = $1";
  auto result = txn.exec(pqxx::zview(sql), p);
  if (result.empty())
    return std::nullopt;

  const auto &r = result[0];
  UserRow row;
  row.userId = r[0].as<std::string>();
  row.email = r[1].as<std::string>();
  row.phone = readText(r[2]);
  row.displayName = r[3].as<std::string>();
  row.avatar = readText(r[4]);
  row.bio = readText(r[5]);
  row.version = readInt(r[6]).value_or(1);
  row.deletedAt = readTimestamp(r[7]);
  row.createdAt = readRequiredTimestamp(r[8]);
  row.updatedAt = readRequiredTimestamp(r[9]);
  row.event.eventId = readText(r[10]);
  row.event.eventTimestamp = readTimestamp(r[11]);
  return row;
}

size_t UserDAL::countActiveUsers() {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());
  auto result = txn.exec("SELECT COUNT(*) FROM analytics.active_users");
  return result[0][0].as<size_t>();
}
