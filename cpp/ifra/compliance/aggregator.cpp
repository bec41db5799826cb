#include "ifra/compliance/aggregator.hpp"

#include "ifra/core/error.hpp"
#include "ifra/core/logging.hpp"
#include "ifra/core/numeric.hpp"

namespace ifra {

void ComponentLedger::add(const std::string& key, double concentration,
                          const std::string& material_name, bool exempt) {
  // Entries are validated before they reach the ledger.
  IFRA_ENSURE(is_finite_nonneg(concentration), ErrorCode::kInvariant,
              "ComponentLedger: non-finite or negative concentration for " + key + " from " + material_name);
  ComponentBucket& b = buckets_[key];
  b.total += concentration;
  b.sources[material_name] += concentration;
  b.phototoxicity_exempt = b.phototoxicity_exempt && exempt;
}

std::vector<StandardAggregation> aggregate_by_standard(const ComponentLedger& ledger,
                                                       const ReferenceData& data) {
  std::map<std::string, StandardAggregation> by_id;

  for (const auto& [cas, bucket] : ledger.buckets()) {
    const std::vector<std::string>* ids = data.standards_for(cas);
    if (!ids) continue;

    for (const auto& id : *ids) {
      const Standard* std_def = data.find_standard(id);
      if (!std_def) {
        log(LogLevel::DEBUG, "aggregate: CAS " + cas + " maps to unknown standard " + id);
        continue;
      }
      if (bucket.phototoxicity_exempt && std_def->is_phototoxic()) continue;

      auto [it, inserted] = by_id.try_emplace(id);
      StandardAggregation& agg = it->second;
      if (inserted) {
        agg.id = id;
        agg.name = std_def->name;
        agg.type = std_def->type;
        agg.limit = std_def->limit_cat4;
      }
      agg.total += bucket.total;
      for (const auto& [material, conc] : bucket.sources) {
        agg.sources[material] += conc;
      }
    }
  }

  std::vector<StandardAggregation> out;
  out.reserve(by_id.size());
  for (auto& [id, agg] : by_id) out.push_back(std::move(agg));
  return out;
}

} // namespace ifra
