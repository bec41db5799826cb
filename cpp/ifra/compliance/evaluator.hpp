#pragma once
/*
================================================================================
Compliance: Evaluator (Per-Standard Gates + Phototoxicity + Max Safe Dosage)
FILE: cpp/ifra/compliance/evaluator.hpp

Key rules:
  - No limit => specification only: pass, ratio 0.
  - ratio = concentration / limit; a zero limit gives 0 for zero
    concentration and +infinity otherwise.
  - pass iff concentration <= limit + pass_tolerance.
  - exceedance % = max(0, (ratio - 1) * 100).
  - Phototoxicity: sum over phototoxic standards with a positive limit of
    concentration / limit; pass iff sum <= phototoxicity_sum_limit.
  - Critical component: highest ratio, standards first (id order) then the
    phototoxicity aggregate; strictly greater wins so ties keep the first.
  - max safe dosage = finished_dosage / max_ratio. Composition is fixed and
    only dilution varies, so every concentration scales linearly with dosage.
================================================================================
*/

#include <optional>
#include <string>
#include <vector>

#include "ifra/compliance/aggregator.hpp"
#include "ifra/compliance/compliance_types.hpp"
#include "ifra/core/settings.hpp"

namespace ifra {

struct Evaluation {
  std::vector<StandardResult> results;
  PhototoxicityResult phototoxicity;
  std::optional<std::string> critical_component;
  double max_ratio = 0.0;
  double max_safe_dosage = 100.0;
  bool all_pass = true;
};

// Concentration-to-limit ratio (see rules above). `limit` absent => 0.
double limit_ratio(double concentration, const std::optional<double>& limit) noexcept;

Evaluation evaluate_standards(const std::vector<StandardAggregation>& aggregations,
                              double finished_dosage,
                              const EvaluationSettings& settings);

} // namespace ifra
