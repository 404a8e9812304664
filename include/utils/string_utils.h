#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

// Splits on the delimiter, trims every piece and drops the empty ones.
inline std::vector<std::string> splitTrimmed(std::string_view str,
                                             char delimiter) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= str.size()) {
    size_t end = str.find(delimiter, start);
    if (end == std::string_view::npos)
      end = str.size();
    std::string piece = trim(str.substr(start, end - start));
    if (!piece.empty())
      parts.push_back(std::move(piece));
    start = end + 1;
  }
  return parts;
}

} // namespace StringUtils

#endif
