#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace TimeUtils {

using Timestamp = std::chrono::system_clock::time_point;
using OptionalTimestamp = std::optional<Timestamp>;

namespace detail {

inline bool readDigits(std::string_view s, size_t &pos, size_t count,
                       int &out) {
  if (pos + count > s.size())
    return false;
  int value = 0;
  for (size_t i = 0; i < count; ++i) {
    char c = s[pos + i];
    if (c < '0' || c > '9')
      return false;
    value = value * 10 + (c - '0');
  }
  pos += count;
  out = value;
  return true;
}

inline bool atEnd(std::istringstream &in) {
  return in.eof() || in.peek() == std::char_traits<char>::eof();
}

} // namespace detail

// Parses ISO-8601 date-times as producers emit them:
//   2024-05-01T10:00:00Z, 2024-05-01T10:00:00.123456+02:00,
//   2024-05-01 10:00:00, 2024-05-01
// A value without an offset is taken as UTC. Fractions beyond microseconds
// are truncated. Throws std::invalid_argument on anything else.
inline Timestamp parseIsoTimestamp(std::string_view text) {
  auto fail = [&text]() -> std::invalid_argument {
    return std::invalid_argument("Invalid ISO-8601 timestamp: '" +
                                 std::string(text) + "'");
  };

  std::tm tm = {};
  std::istringstream in{std::string(text)};
  in >> std::get_time(&tm, "%Y-%m-%d");
  if (in.fail())
    throw fail();

  if (!detail::atEnd(in)) {
    char sep = static_cast<char>(in.get());
    if (sep != 'T' && sep != 't' && sep != ' ')
      throw fail();
    in >> std::get_time(&tm, "%H:%M");
    if (in.fail())
      throw fail();
    if (!detail::atEnd(in) && in.peek() == ':') {
      in.get();
      in >> std::get_time(&tm, "%S");
      if (in.fail())
        throw fail();
    }
  }
  if (tm.tm_sec > 59)
    throw fail();

  size_t pos = in.eof() ? text.size() : static_cast<size_t>(in.tellg());
  int64_t micros = 0;
  int offsetMinutes = 0;

  if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
    ++pos;
    size_t digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 6)
        micros = micros * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0)
      throw fail();
    for (size_t i = digits; i < 6; ++i)
      micros *= 10;
  }

  if (pos < text.size()) {
    char tz = text[pos];
    if (tz == 'Z' || tz == 'z') {
      ++pos;
    } else if (tz == '+' || tz == '-') {
      ++pos;
      int offHour = 0, offMinute = 0;
      if (!detail::readDigits(text, pos, 2, offHour))
        throw fail();
      if (pos < text.size() && text[pos] == ':')
        ++pos;
      if (pos < text.size() && !detail::readDigits(text, pos, 2, offMinute))
        throw fail();
      if (offHour > 23 || offMinute > 59)
        throw fail();
      offsetMinutes = (offHour * 60 + offMinute) * (tz == '-' ? -1 : 1);
    } else {
      throw fail();
    }
  }

  if (pos != text.size())
    throw fail();

  // timegm normalizes days past the end of the month; reject those.
  const int year = tm.tm_year, month = tm.tm_mon, day = tm.tm_mday;
  std::time_t seconds = timegm(&tm);
  std::tm check = {};
  if (gmtime_r(&seconds, &check) == nullptr || check.tm_year != year ||
      check.tm_mon != month || check.tm_mday != day)
    throw fail();

  int64_t utcSeconds = static_cast<int64_t>(seconds) -
                       static_cast<int64_t>(offsetMinutes) * 60;
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(
      std::chrono::microseconds(utcSeconds * 1000000 + micros)));
}

// Empty text means absent.
inline OptionalTimestamp parseOptionalIsoTimestamp(std::string_view text) {
  if (text.empty())
    return std::nullopt;
  return parseIsoTimestamp(text);
}

namespace detail {
inline std::string format(Timestamp tp, char separator, const char *suffix) {
  int64_t totalMicros =
      std::chrono::duration_cast<std::chrono::microseconds>(
          tp.time_since_epoch())
          .count();
  int64_t seconds = totalMicros / 1000000;
  int64_t micros = totalMicros % 1000000;
  if (micros < 0) {
    micros += 1000000;
    --seconds;
  }

  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm_buf = {};
  gmtime_r(&t, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d") << separator
      << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setw(6)
      << std::setfill('0') << micros << suffix;
  return oss.str();
}
} // namespace detail

// Wire rendition used in envelopes: 2024-05-01T10:00:00.000000Z
inline std::string formatIsoUtc(Timestamp tp) {
  return detail::format(tp, 'T', "Z");
}

// Literal accepted by PostgreSQL for TIMESTAMPTZ parameters.
inline std::string formatSqlTimestamp(Timestamp tp) {
  return detail::format(tp, ' ', "+00:00");
}

inline Timestamp nowUtc() { return std::chrono::system_clock::now(); }

} // namespace TimeUtils

#endif
