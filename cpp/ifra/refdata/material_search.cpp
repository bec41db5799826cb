#include "ifra/refdata/material_search.hpp"

#include "ifra/core/text.hpp"

namespace ifra {

MaterialSearchResult search_materials(const ReferenceData& data, std::string_view query, size_t limit) {
  MaterialSearchResult out;
  const std::string q = trim(query);
  if (q.empty()) return out;

  for (const auto& [key, rec] : data.contributions()) {
    if (!contains_icase(key, q) && !contains_icase(rec.name, q)) continue;
    ++out.total;
    if (out.matches.size() < limit) {
      out.matches.push_back(MaterialMatch{key, rec.name, data.is_mapped(key)});
    }
  }
  return out;
}

} // namespace ifra
