#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ifra/core/text.hpp"

namespace ifra {

// Furocoumarin-free / distilled / terpeneless oils are not phototoxic.
inline bool is_phototoxicity_exempt(std::string_view material_name, const std::vector<std::string>& tokens) {
  return contains_any_icase(material_name, tokens);
}

// "Bergamot 10% in DPG", "Oakmoss dilution", "Civet (dil)".
inline bool is_declared_dilution(std::string_view material_name, const std::vector<std::string>& tokens) {
  return contains_any_icase(material_name, tokens);
}

} // namespace ifra
