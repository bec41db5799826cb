#include "ifra/compliance/integrity.hpp"

#include <iomanip>
#include <sstream>

#include "ifra/compliance/heuristics.hpp"
#include "ifra/core/numeric.hpp"

namespace ifra {

std::optional<std::string> check_composition(const ContributionRecord& record,
                                             std::string_view material_name,
                                             const IntegritySettings& settings) {
  const double documented = record.documented_pct();
  if (documented >= settings.min_documented_pct) return std::nullopt;
  if (is_declared_dilution(material_name, settings.dilution_tokens)) return std::nullopt;

  std::ostringstream ss;
  ss << material_name << " (Composition only totals "
     << std::fixed << std::setprecision(1) << round_to(documented, 1) << "%)";
  return ss.str();
}

} // namespace ifra
