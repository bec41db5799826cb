#include "ifra/compliance/compliance_engine.hpp"

#include <algorithm>
#include <set>
#include <sstream>
#include <tuple>
#include <utility>

#include "ifra/compliance/aggregator.hpp"
#include "ifra/compliance/evaluator.hpp"
#include "ifra/compliance/heuristics.hpp"
#include "ifra/compliance/integrity.hpp"
#include "ifra/compliance/resolver.hpp"
#include "ifra/core/error.hpp"
#include "ifra/core/logging.hpp"
#include "ifra/core/text.hpp"

namespace ifra {

namespace {

struct PendingEntry {
  std::string key;  // empty => unresolved
  const NormalizedEntry* entry = nullptr;
};

bool canonical_less(const PendingEntry& a, const PendingEntry& b) {
  const auto& ea = *a.entry;
  const auto& eb = *b.entry;
  return std::tie(a.key, ea.name, ea.concentration, ea.cas, ea.sku) <
         std::tie(b.key, eb.name, eb.concentration, eb.cas, eb.sku);
}

} // namespace

ComplianceEngine::ComplianceEngine(std::shared_ptr<const ReferenceData> data, EngineSettings settings)
    : data_(std::move(data)), settings_(std::move(settings)) {
  IFRA_ENSURE(data_ != nullptr, ErrorCode::kInvalidArgument, "ComplianceEngine: reference data is null");
  settings_.validate_or_throw();
}

std::optional<std::string> ComplianceEngine::resolution_key(const std::optional<std::string>& cas,
                                                            const std::optional<std::string>& sku,
                                                            const std::string& name) const {
  const std::optional<std::string> candidates[] = {cas, sku, name};
  for (const auto& c : candidates) {
    if (!c) continue;
    std::string key = normalize_key(*c);
    if (key.empty()) continue;
    if (data_->is_decomposable(key) || data_->is_mapped(key)) return key;
  }
  return std::nullopt;
}

ComplianceResult ComplianceEngine::calculate(const std::vector<FormulaEntry>& formula,
                                             double finished_dosage) const {
  const std::vector<NormalizedEntry> normalized = normalize_formula(formula, finished_dosage);

  std::vector<PendingEntry> pending;
  pending.reserve(normalized.size());
  for (const auto& n : normalized) {
    pending.push_back(PendingEntry{resolution_key(n.cas, n.sku, n.name).value_or(std::string{}), &n});
  }
  std::sort(pending.begin(), pending.end(), canonical_less);

  ComplianceResult result;
  result.finished_dosage = finished_dosage;
  result.reference_fingerprint = data_->fingerprint();

  const ContributionResolver resolver(*data_, settings_.resolution.max_depth);
  ComponentLedger ledger;
  std::set<std::string> truncated;

  for (const auto& p : pending) {
    const NormalizedEntry& e = *p.entry;

    if (p.key.empty()) {
      log(LogLevel::WARN, "material not found in reference data: " + e.name);
      result.unresolved_materials.push_back(e.name);
      continue;
    }

    const bool exempt = is_phototoxicity_exempt(e.name, settings_.exemption.phototoxicity_exempt_tokens);

    if (const ContributionRecord* rec = data_->find_contribution(p.key)) {
      if (auto warning = check_composition(*rec, e.name, settings_.integrity)) {
        result.data_integrity_warnings.push_back(std::move(*warning));
      }

      Resolution r = resolver.resolve(p.key, e.concentration);
      for (const auto& [cas, conc] : r.contributions) {
        ledger.add(cas, conc, e.name, exempt);
      }
      for (auto& t : r.truncated) {
        log(LogLevel::WARN, "resolution depth limit reached under " + e.name + " at " + t);
        truncated.insert(std::move(t));
      }
    }

    if (data_->is_mapped(p.key)) {
      ledger.add(p.key, e.concentration, e.name, exempt);
    }

    if (get_log_level() == LogLevel::DEBUG) {
      std::ostringstream ss;
      ss << "resolved " << e.name << " via '" << p.key << "' at " << e.concentration << "%"
         << (exempt ? " (phototoxicity exempt)" : "");
      log(LogLevel::DEBUG, ss.str());
    }
  }

  const std::vector<StandardAggregation> aggregations = aggregate_by_standard(ledger, *data_);
  Evaluation ev = evaluate_standards(aggregations, finished_dosage, settings_.evaluation);

  result.results = std::move(ev.results);
  result.phototoxicity = ev.phototoxicity;
  result.critical_component = std::move(ev.critical_component);
  result.max_ratio = ev.max_ratio;
  result.max_safe_dosage = ev.max_safe_dosage;
  result.truncated_materials.assign(truncated.begin(), truncated.end());
  result.is_compliant = ev.all_pass && ev.phototoxicity.pass;
  return result;
}

} // namespace ifra
