#ifndef DAL_SUPPORT_H
#define DAL_SUPPORT_H

#include "dal/row_types.h"
#include <pqxx/pqxx>
#include <string>

// Conversions between row structs and pqxx parameters/fields shared by the
// DAL implementations. Timestamps travel as UTC text in both directions so
// the session time zone never matters.
namespace DalSupport {

inline std::string toSql(const Timestamp &ts) {
  return TimeUtils::formatSqlTimestamp(ts);
}

inline OptionalText toSql(const OptionalTimestamp &ts) {
  if (!ts)
    return std::nullopt;
  return TimeUtils::formatSqlTimestamp(*ts);
}

// Select-list expression rendering a TIMESTAMPTZ column as ISO-8601 UTC.
inline std::string utcColumn(const std::string &column) {
  return "to_char(" + column +
         " AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.US\"Z\"') AS " +
         column;
}

inline OptionalText readText(const pqxx::field &field) {
  if (field.is_null())
    return std::nullopt;
  return field.as<std::string>();
}

inline OptionalInt readInt(const pqxx::field &field) {
  if (field.is_null())
    return std::nullopt;
  return field.as<int64_t>();
}

inline OptionalDouble readDouble(const pqxx::field &field) {
  if (field.is_null())
    return std::nullopt;
  return field.as<double>();
}

inline OptionalTimestamp readTimestamp(const pqxx::field &field) {
  if (field.is_null())
    return std::nullopt;
  return TimeUtils::parseIsoTimestamp(field.as<std::string>());
}

inline Timestamp readRequiredTimestamp(const pqxx::field &field) {
  return TimeUtils::parseIsoTimestamp(field.as<std::string>());
}

inline void appendBookkeeping(pqxx::params &p, const EventBookkeeping &event) {
  p.append(event.eventId);
  p.append(toSql(event.eventTimestamp));
}

} // namespace DalSupport

#endif
