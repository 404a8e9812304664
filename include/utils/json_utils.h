#ifndef JSON_UTILS_H
#define JSON_UTILS_H

#include "core/errors.h"
#include "utils/time_utils.h"
#include <cmath>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;

// Safe navigation over loosely shaped payloads. Absent keys and explicit
// nulls read as "nothing" (empty object, empty array or nullopt). A value
// of the wrong type for the accessor is a contract violation and raises
// PayloadFieldError naming the key.
namespace JsonUtils {

inline std::string fieldPath(const std::string &context,
                             const std::string &key) {
  return context.empty() ? key : context + "." + key;
}

inline const json &emptyObject() {
  static const json empty = json::object();
  return empty;
}

inline const json &emptyArray() {
  static const json empty = json::array();
  return empty;
}

inline bool isPresent(const json &parent, const char *key) {
  return parent.is_object() && parent.contains(key) && !parent[key].is_null();
}

inline const json &object(const json &parent, const char *key) {
  if (!isPresent(parent, key) || !parent[key].is_object())
    return emptyObject();
  return parent[key];
}

inline const json &array(const json &parent, const char *key) {
  if (!isPresent(parent, key) || !parent[key].is_array())
    return emptyArray();
  return parent[key];
}

inline std::optional<std::string> string(const json &parent, const char *key) {
  if (!isPresent(parent, key))
    return std::nullopt;
  const json &value = parent[key];
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number() || value.is_boolean())
    return value.dump();
  throw PayloadFieldError(key, "expected a string, got " +
                                   std::string(value.type_name()));
}

inline std::optional<int64_t> integer(const json &parent, const char *key) {
  if (!isPresent(parent, key))
    return std::nullopt;
  const json &value = parent[key];
  if (value.is_number_unsigned()) {
    if (value.get<uint64_t>() >
        static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      throw PayloadFieldError(key, "integer out of range: " + value.dump());
    return static_cast<int64_t>(value.get<uint64_t>());
  }
  if (value.is_number_integer())
    return value.get<int64_t>();
  if (value.is_number_float()) {
    // 2^63 is exact as a double; anything at or above it does not fit.
    const double d = value.get<double>();
    if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0))
      throw PayloadFieldError(key, "integer out of range: " + value.dump());
    if (std::trunc(d) != d)
      throw PayloadFieldError(key, "expected an integer, got " + value.dump());
    return static_cast<int64_t>(d);
  }
  if (value.is_boolean())
    return value.get<bool>() ? 1 : 0;
  if (value.is_string()) {
    try {
      size_t used = 0;
      const std::string text = value.get<std::string>();
      int64_t parsed = std::stoll(text, &used);
      if (used == text.size())
        return parsed;
    } catch (const std::exception &) {
    }
  }
  throw PayloadFieldError(key, "expected an integer, got " + value.dump());
}

inline std::optional<double> number(const json &parent, const char *key) {
  if (!isPresent(parent, key))
    return std::nullopt;
  const json &value = parent[key];
  if (value.is_number())
    return value.get<double>();
  if (value.is_string()) {
    try {
      size_t used = 0;
      const std::string text = value.get<std::string>();
      double parsed = std::stod(text, &used);
      if (used == text.size())
        return parsed;
    } catch (const std::exception &) {
    }
  }
  throw PayloadFieldError(key, "expected a number, got " + value.dump());
}

// Every timestamp in every payload goes through here, so top-level fields,
// nested stats and collection items all accept the same formats.
inline TimeUtils::OptionalTimestamp timestamp(const json &parent,
                                              const char *key) {
  auto text = string(parent, key);
  if (!text)
    return std::nullopt;
  try {
    return TimeUtils::parseOptionalIsoTimestamp(*text);
  } catch (const std::invalid_argument &e) {
    throw PayloadFieldError(key, e.what());
  }
}

// Serialized JSON for display-only blob columns. Absent or null gives
// nullopt so the column stays NULL.
inline std::optional<std::string> jsonText(const json &parent,
                                           const char *key) {
  if (!isPresent(parent, key))
    return std::nullopt;
  return parent[key].dump();
}

inline std::string requireString(const json &parent, const char *key,
                                 const std::string &context = "") {
  auto value = string(parent, key);
  if (!value || value->empty())
    throw PayloadFieldError(fieldPath(context, key), "required field missing");
  return *value;
}

inline int64_t requireInteger(const json &parent, const char *key,
                              const std::string &context = "") {
  auto value = integer(parent, key);
  if (!value)
    throw PayloadFieldError(fieldPath(context, key), "required field missing");
  return *value;
}

inline TimeUtils::Timestamp requireTimestamp(const json &parent,
                                             const char *key,
                                             const std::string &context = "") {
  auto value = timestamp(parent, key);
  if (!value)
    throw PayloadFieldError(fieldPath(context, key), "required field missing");
  return *value;
}

inline const json &requireObject(const json &parent, const char *key,
                                 const std::string &context = "") {
  if (!isPresent(parent, key) || !parent[key].is_object())
    throw PayloadFieldError(fieldPath(context, key), "required object missing");
  return parent[key];
}

} // namespace JsonUtils

#endif
