#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace StringUtils {

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
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

// Accepts plain or schema-qualified SQL identifiers ("posts",
// "wp.posts"). Table and column names are interpolated into queries, so
// anything else is rejected before it reaches the database.
inline bool isSafeIdentifier(std::string_view str) {
  if (str.empty() || str.size() > 127)
    return false;

  bool expectStart = true;
  for (char ch : str) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (ch == '.') {
      if (expectStart)
        return false;
      expectStart = true;
      continue;
    }
    if (expectStart) {
      if (!std::isalpha(c) && ch != '_')
        return false;
      expectStart = false;
      continue;
    }
    if (!std::isalnum(c) && ch != '_')
      return false;
  }
  return !expectStart;
}

} // namespace StringUtils

#endif
