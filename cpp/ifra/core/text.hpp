#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ifra {

// Trim ASCII whitespace from both ends.
std::string trim(std::string_view s);

// ASCII lower-case copy.
std::string to_lower(std::string_view s);

/// Canonical lookup key for CAS numbers, SKUs and material names:
/// surrounding whitespace removed, ASCII letters lower-cased.
std::string normalize_key(std::string_view s);

// Case-insensitive substring test. An empty needle never matches.
bool contains_icase(std::string_view haystack, std::string_view needle);

// True if any token occurs in `haystack`, case-insensitively.
bool contains_any_icase(std::string_view haystack, const std::vector<std::string>& tokens);

} // namespace ifra
