#pragma once
/*
================================================================================
Compliance: Result Data Model
FILE: cpp/ifra/compliance/compliance_types.hpp

Purpose:
  Value types produced by one compliance calculation and consumed by the
  report writers (JSON / CSV / text) and any UI layer.

Rules:
  - All concentrations are % of the finished product.
  - A standard without a Category 4 limit is "specification only": it always
    passes with ratio 0 and carries no limit.
  - Ratios may be +infinity (non-zero concentration against a zero limit);
    writers must not emit them as JSON numbers.

Note:
  This header defines *types only*. Computation happens in the resolver,
  aggregator, integrity and evaluator units.
================================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ifra/core/hashing.hpp"
#include "ifra/refdata/reference_data.hpp"

namespace ifra {

inline constexpr const char* kPhototoxicityAggregateName = "Phototoxicity (Sum of Ratios)";

// Material display name -> concentration contributed (% finished product).
using SourceMap = std::map<std::string, double>;

struct StandardResult {
  std::string standard_id;
  std::string standard_name;
  StandardType type = StandardType::kRestriction;

  double concentration = 0.0;
  std::optional<double> limit;  // absent => specification only
  bool pass = true;
  double ratio = 0.0;
  double exceedance_pct = 0.0;

  SourceMap sources;
};

struct PhototoxicityResult {
  double sum_of_ratios = 0.0;
  double limit = 1.0;  // sum-of-ratios threshold the sum was checked against
  bool pass = true;
  double exceedance_pct = 0.0;
};

struct ComplianceResult {
  bool is_compliant = true;

  std::vector<StandardResult> results;  // ordered by standard id
  PhototoxicityResult phototoxicity;

  // Standard name (or kPhototoxicityAggregateName) with the highest ratio.
  std::optional<std::string> critical_component;
  double max_ratio = 0.0;  // ratio of the critical component, 0 if none

  double max_safe_dosage = 100.0;  // % concentrate in finished product
  double finished_dosage = 100.0;

  std::vector<std::string> unresolved_materials;
  std::vector<std::string> data_integrity_warnings;

  // Material keys whose expansion hit the depth bound; their deeper
  // constituents are missing from the aggregation.
  std::vector<std::string> truncated_materials;

  Hash64 reference_fingerprint{};
};

} // namespace ifra
