#include "dal/supplier_dal.h"
#include "core/logger.h"
#include "dal/dal_support.h"

using namespace DalSupport;

void SupplierDAL::upsertSupplier(const SupplierRow &row) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(row.supplierId);
    p.append(row.email);
    p.append(row.primaryPhone);
    p.append(row.contactPersonName);
    p.append(row.contactPersonTitle);
    p.append(row.contactPersonEmail);
    p.append(row.contactPersonPhone);
    p.append(row.legalName);
    p.append(row.dbaName);
    p.append(row.streetAddress1);
    p.append(row.streetAddress2);
    p.append(row.city);
    p.append(row.state);
    p.append(row.zipCode);
    p.append(row.country);
    p.append(row.supportEmail);
    p.append(row.supportPhone);
    p.append(row.facebookUrl);
    p.append(row.instagramHandle);
    p.append(row.twitterHandle);
    p.append(row.linkedinUrl);
    p.append(row.timezone);
    p.append(toSql(row.createdAt));
    p.append(toSql(row.updatedAt));
    appendBookkeeping(p, row.event);

    txn.exec(
        pqxx::zview(
            "INSERT INTO analytics.suppliers (supplier_id, email, "
            "primary_phone, contact_person_name, contact_person_title, "
            "contact_person_email, contact_person_phone, legal_name, "
            "dba_name, street_address_1, street_address_2, city, state, "
            "zip_code, country, support_email, support_phone, facebook_url, "
            "instagram_handle, twitter_handle, linkedin_url, timezone, "
            "created_at, updated_at, event_id, event_timestamp) "
            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, "
            "$14, $15, $16, $17, $18, $19, $20, $21, $22, $23::timestamptz, "
            "$24::timestamptz, $25, $26::timestamptz) "
            "ON CONFLICT (supplier_id) DO UPDATE SET "
            "email = EXCLUDED.email, primary_phone = EXCLUDED.primary_phone, "
            "contact_person_name = EXCLUDED.contact_person_name, "
            "contact_person_title = EXCLUDED.contact_person_title, "
            "contact_person_email = EXCLUDED.contact_person_email, "
            "contact_person_phone = EXCLUDED.contact_person_phone, "
            "legal_name = EXCLUDED.legal_name, dba_name = EXCLUDED.dba_name, "
            "street_address_1 = EXCLUDED.street_address_1, "
            "street_address_2 = EXCLUDED.street_address_2, "
            "city = EXCLUDED.city, state = EXCLUDED.state, "
            "zip_code = EXCLUDED.zip_code, country = EXCLUDED.country, "
            "support_email = EXCLUDED.support_email, "
            "support_phone = EXCLUDED.support_phone, "
            "facebook_url = EXCLUDED.facebook_url, "
            "instagram_handle = EXCLUDED.instagram_handle, "
            "twitter_handle = EXCLUDED.twitter_handle, "
            "linkedin_url = EXCLUDED.linkedin_url, "
            "timezone = EXCLUDED.timezone, updated_at = EXCLUDED.updated_at, "
            "event_id = EXCLUDED.event_id, "
            "event_timestamp = EXCLUDED.event_timestamp"),
        p);
    txn.commit();
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "SupplierDAL",
                  "upsertSupplier " + row.supplierId + " failed: " + e.what());
    throw;
  }
}

void SupplierDAL::deleteSupplier(const std::string &supplierId) {
  try {
    ConnectionGuard guard(pool_);
    pqxx::work txn(guard.get());

    pqxx::params p;
    p.append(supplierId);
    auto result = txn.exec(
        pqxx::zview("DELETE FROM analytics.suppliers WHERE supplier_id = $1"),
        p);
    txn.commit();

    if (result.affected_rows() == 0) {
      Logger::debug(LogCategory::DATABASE, "SupplierDAL",
                    "deleteSupplier: " + supplierId + " already absent");
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::DATABASE, "SupplierDAL",
                  "deleteSupplier " + supplierId + " failed: " + e.what());
    throw;
  }
}

std::optional<SupplierRow>
SupplierDAL::findSupplier(const std::string &supplierId) {
  ConnectionGuard guard(pool_);
  pqxx::read_transaction txn(guard.get());

  pqxx::params p;
  p.append(supplierId);
  const std::string sql =
      "SELECT supplier_id, email, primary_phone, contact_person_name, "
      "contact_person_title, contact_person_email, contact_person_phone, "
      "legal_name, dba_name, street_address_1, street_address_2, city, state, "
      "zip_code, country, support_email, support_phone, facebook_url, "
      "instagram_handle, twitter_handle, linkedin_url, timezone, " +
      utcColumn("created_at") + ", " + utcColumn("updated_at") +
      ", event_id, " + utcColumn("event_timestamp") +
      " FROM analytics.suppliers WHERE supplier_id = $1";
  auto result = txn.exec(pqxx::zview(sql), p);
  if (result.empty())
    return std::nullopt;

  const auto &r = result[0];
  SupplierRow row;
  row.supplierId = r[0].as<std::string>();
  row.email = r[1].as<std::string>();
  row.primaryPhone = r[2].as<std::string>();
  row.contactPersonName = readText(r[3]);
  row.contactPersonTitle = readText(r[4]);
  row.contactPersonEmail = readText(r[5]);
  row.contactPersonPhone = readText(r[6]);
  row.legalName = r[7].as<std::string>();
  row.dbaName = readText(r[8]);
  row.streetAddress1 = readText(r[9]);
  row.streetAddress2 = readText(r[10]);
  row.city = readText(r[11]);
  row.state = readText(r[12]);
  row.zipCode = readText(r[13]);
  row.country = readText(r[14]);
  row.supportEmail = readText(r[15]);
  row.supportPhone = readText(r[16]);
  row.facebookUrl = readText(r[17]);
  row.instagramHandle = readText(r[18]);
  row.twitterHandle = readText(r[19]);
  row.linkedinUrl = readText(r[20]);
  row.timezone = readText(r[21]);
  row.createdAt = readRequiredTimestamp(r[22]);
  row.updatedAt = readRequiredTimestamp(r[23]);
  row.event.eventId = readText(r[24]);
  row.event.eventTimestamp = readTimestamp(r[25]);
  return row;
}
