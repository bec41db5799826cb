#pragma once
/*
================================================================================
Compliance: Engine Facade
FILE: cpp/ifra/compliance/compliance_engine.hpp

Pipeline for one formula:
  normalize -> resolve each entry -> ledger -> aggregate by standard
            -> integrity warnings + evaluation -> ComplianceResult

Resolution key per entry, first match wins: cas, sku, name (normalized). A
candidate matches if it is a key of the contributions table or the CAS
mapping. Entries without a match are listed in unresolved_materials and
contribute nothing.

Entries are processed in a canonical order (resolution key, name,
concentration), so any permutation of the same formula yields an identical
result.

Thread-safety:
  calculate() is const and keeps all mutable state on its own stack; one
  engine may serve concurrent calls.
================================================================================
*/

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ifra/compliance/compliance_types.hpp"
#include "ifra/core/settings.hpp"
#include "ifra/formula/formula.hpp"
#include "ifra/refdata/reference_data.hpp"

namespace ifra {

class ComplianceEngine final {
 public:
  /// Throws Error(kInvalidArgument) if `data` is null or settings are invalid.
  explicit ComplianceEngine(std::shared_ptr<const ReferenceData> data,
                            EngineSettings settings = {});

  /// Throws Error(kInvalidArgument) for a dosage outside (0,100] and
  /// Error(kInvalidNumeric) for a non-finite or negative entry quantity.
  ComplianceResult calculate(const std::vector<FormulaEntry>& formula,
                             double finished_dosage) const;

  /// Normalized lookup key for an entry, or nullopt if nothing matches.
  std::optional<std::string> resolution_key(const std::optional<std::string>& cas,
                                            const std::optional<std::string>& sku,
                                            const std::string& name) const;

  const ReferenceData& reference() const noexcept { return *data_; }
  const EngineSettings& settings() const noexcept { return settings_; }

 private:
  std::shared_ptr<const ReferenceData> data_;
  EngineSettings settings_;
};

} // namespace ifra
