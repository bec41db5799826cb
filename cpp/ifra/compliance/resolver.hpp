#pragma once
/*
===============================================================================
Compliance: Contribution Resolver
File: cpp/ifra/compliance/resolver.hpp
===============================================================================

Expands a material into the concentrations of its constituents.

For a material at concentration C with constituent (key, P):
  absolute = C * P / 100
and the constituent is classified (non-exclusive):
  MappedStandard  key is in the CAS mapping     -> absolute recorded under key
  Decomposable    key has its own composition   -> expanded one level deeper
  Leaf            neither                       -> absolute recorded under key

A key that is both MappedStandard and Decomposable is counted on both paths.

Traversal is an explicit work stack with a depth counter (the material passed
in is depth 0). A decomposable constituent that would sit deeper than
max_depth is not expanded and its key is reported as truncated.
===============================================================================
*/

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "ifra/refdata/reference_data.hpp"

namespace ifra {

struct ConstituentKind {
  bool mapped_standard = false;
  bool decomposable = false;

  bool leaf() const noexcept { return !mapped_standard && !decomposable; }
};

ConstituentKind classify_constituent(const ReferenceData& data, std::string_view key);

struct Resolution {
  std::map<std::string, double> contributions;  // key -> % finished product
  std::vector<std::string> truncated;           // sorted, unique
};

class ContributionResolver final {
 public:
  ContributionResolver(const ReferenceData& data, int max_depth)
      : data_(data), max_depth_(max_depth) {}

  // Unknown material keys resolve to an empty Resolution.
  Resolution resolve(std::string_view material_key, double concentration) const;

 private:
  const ReferenceData& data_;
  int max_depth_;
};

} // namespace ifra
