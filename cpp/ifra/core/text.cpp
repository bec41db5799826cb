#include "ifra/core/text.hpp"

#include <algorithm>
#include <cctype>

namespace ifra {

namespace {

inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline char lower_char(char c) {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::string trim(std::string_view s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && is_space(s[b])) ++b;
  while (e > b && is_space(s[e - 1])) --e;
  return std::string(s.substr(b, e - b));
}

std::string to_lower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), lower_char);
  return out;
}

std::string normalize_key(std::string_view s) {
  return to_lower(trim(s));
}

bool contains_icase(std::string_view haystack, std::string_view needle) {
  if (needle.empty() || needle.size() > haystack.size()) return false;
  const auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](char a, char b) { return lower_char(a) == lower_char(b); });
  return it != haystack.end();
}

bool contains_any_icase(std::string_view haystack, const std::vector<std::string>& tokens) {
  for (const auto& t : tokens) {
    if (contains_icase(haystack, t)) return true;
  }
  return false;
}

} // namespace ifra
