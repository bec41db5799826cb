#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ifra/core/settings.hpp"
#include "ifra/refdata/reference_data.hpp"

namespace ifra {

/// Flag a composition that documents less than min_documented_pct of the
/// material, unless the name declares a dilution. Returns e.g.
/// "Lavandin absolute (Composition only totals 62.5%)". Informational only.
std::optional<std::string> check_composition(const ContributionRecord& record,
                                             std::string_view material_name,
                                             const IntegritySettings& settings);

} // namespace ifra
