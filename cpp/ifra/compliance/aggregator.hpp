#pragma once
/*
===============================================================================
Compliance: Standard Aggregator
File: cpp/ifra/compliance/aggregator.hpp
===============================================================================

Two stages:

1) ComponentLedger: per CAS (or leaf key) bucket of resolved concentration,
   attributed to the formula materials that produced it. A bucket is
   phototoxicity-exempt only if every contributing material is exempt.

2) aggregate_by_standard: fold buckets into the standards they map to. An
   exempt bucket is skipped for phototoxicity standards only; it still counts
   toward every other standard it maps to.
===============================================================================
*/

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ifra/compliance/compliance_types.hpp"
#include "ifra/refdata/reference_data.hpp"

namespace ifra {

struct ComponentBucket {
  double total = 0.0;
  bool phototoxicity_exempt = true;
  SourceMap sources;
};

class ComponentLedger final {
 public:
  void add(const std::string& key, double concentration, const std::string& material_name, bool exempt);

  const std::map<std::string, ComponentBucket>& buckets() const noexcept { return buckets_; }

 private:
  std::map<std::string, ComponentBucket> buckets_;
};

struct StandardAggregation {
  std::string id;
  std::string name;
  StandardType type = StandardType::kRestriction;
  std::optional<double> limit;
  double total = 0.0;
  SourceMap sources;
};

// Ordered by standard id. Standards referenced by the mapping but missing from
// the standards table are skipped.
std::vector<StandardAggregation> aggregate_by_standard(const ComponentLedger& ledger,
                                                       const ReferenceData& data);

} // namespace ifra
