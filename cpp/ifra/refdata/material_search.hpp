#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "ifra/refdata/reference_data.hpp"

namespace ifra {

struct MaterialMatch {
  std::string key;
  std::string name;
  bool regulated = false;  // key also maps to at least one standard
};

struct MaterialSearchResult {
  std::vector<MaterialMatch> matches;  // at most `limit`, sorted by key
  size_t total = 0;                    // matches before the limit was applied
};

/// Case-insensitive substring search over contribution keys and display names.
/// An empty (or all-whitespace) query matches nothing.
MaterialSearchResult search_materials(const ReferenceData& data, std::string_view query, size_t limit = 10);

} // namespace ifra
