#include "ifra/compliance/evaluator.hpp"

#include <algorithm>

#include "ifra/core/numeric.hpp"

namespace ifra {

double limit_ratio(double concentration, const std::optional<double>& limit) noexcept {
  if (!limit) return 0.0;
  if (*limit > 0.0) return concentration / *limit;
  return (concentration == 0.0) ? 0.0 : kInf;
}

Evaluation evaluate_standards(const std::vector<StandardAggregation>& aggregations,
                              double finished_dosage,
                              const EvaluationSettings& settings) {
  Evaluation ev;
  ev.results.reserve(aggregations.size());

  double max_ratio = settings.ratio_floor;
  auto consider = [&](double ratio, const std::string& name) {
    if (ratio > max_ratio) {
      max_ratio = ratio;
      ev.critical_component = name;
    }
  };

  for (const auto& agg : aggregations) {
    StandardResult r;
    r.standard_id = agg.id;
    r.standard_name = agg.name;
    r.type = agg.type;
    r.concentration = agg.total;
    r.limit = agg.limit;
    r.sources = agg.sources;

    if (agg.limit) {
      r.ratio = limit_ratio(agg.total, agg.limit);
      r.pass = agg.total <= *agg.limit + settings.pass_tolerance;
      r.exceedance_pct = std::max(0.0, (r.ratio - 1.0) * 100.0);
    }

    if (!r.pass) ev.all_pass = false;
    consider(r.ratio, r.standard_name);
    ev.results.push_back(std::move(r));
  }

  double sum = 0.0;
  for (const auto& agg : aggregations) {
    if (agg.type != StandardType::kPhototoxicity) continue;
    if (!agg.limit || *agg.limit <= 0.0) continue;
    sum += agg.total / *agg.limit;
  }
  const double photo_ratio = sum / settings.phototoxicity_sum_limit;
  ev.phototoxicity.sum_of_ratios = sum;
  ev.phototoxicity.limit = settings.phototoxicity_sum_limit;
  ev.phototoxicity.pass = sum <= settings.phototoxicity_sum_limit;
  ev.phototoxicity.exceedance_pct = std::max(0.0, (photo_ratio - 1.0) * 100.0);
  consider(photo_ratio, kPhototoxicityAggregateName);

  if (ev.critical_component) {
    ev.max_ratio = max_ratio;
    ev.max_safe_dosage = finished_dosage / max_ratio;
  } else {
    ev.max_ratio = 0.0;
    ev.max_safe_dosage = settings.fully_safe_dosage;
  }
  return ev;
}

} // namespace ifra
