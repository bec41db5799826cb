#pragma once
/*
===============================================================================
Reference Data: Standards, CAS mapping and material contributions
File: cpp/ifra/refdata/reference_data.hpp
===============================================================================

Data model (all keys normalized with ifra::normalize_key, except standard ids
which are opaque identifiers):

  Standard            id -> {name, type, limit_cat4?}
  CasMapping          cas -> ordered set of standard ids
  ContributionRecord  material key -> {display name, constituents[key -> %]}

ReferenceData is immutable once constructed and is shared between engine
instances and concurrent calculations via std::shared_ptr<const ReferenceData>.
===============================================================================
*/

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ifra/core/hashing.hpp"

namespace ifra {

enum class StandardType : int {
  kRestriction   = 0,
  kPhototoxicity = 1,
  kSpecification = 2,
};

const char* to_string(StandardType t) noexcept;

// Table type strings are free text ("RESTRICTION", "Phototoxicity (sum of ratios)", ...).
// Anything containing PHOTOTOXICITY is phototoxic, SPECIFICATION is spec-only,
// everything else restricts.
StandardType classify_standard_type(std::string_view raw);

struct Standard final {
  std::string id;
  std::string name;
  StandardType type = StandardType::kRestriction;
  std::optional<double> limit_cat4;  // % in finished product; absent => specification only

  bool is_phototoxic() const noexcept { return type == StandardType::kPhototoxicity; }

  void validate() const;
};

struct Constituent final {
  std::string key;
  double percent = 0.0;  // mass % of the parent material, [0,100]
};

struct ContributionRecord final {
  std::string key;   // normalized
  std::string name;  // display name
  std::vector<Constituent> constituents;  // unique keys, sorted

  // Sum of declared constituent percentages.
  double documented_pct() const noexcept;

  void validate() const;
};

// Mutable staging tables filled by loaders (or tests) before freezing.
struct ReferenceTables {
  std::map<std::string, Standard> standards;
  std::map<std::string, std::vector<std::string>> cas_mapping;
  std::map<std::string, ContributionRecord> contributions;
};

class ReferenceData final {
 public:
  template <class V>
  using KeyedMap = std::map<std::string, V, std::less<>>;

  /// Normalizes keys, merges duplicates and validates every record.
  /// Throws Error(kInvalidArgument) for invalid records.
  explicit ReferenceData(ReferenceTables tables);

  const Standard* find_standard(std::string_view id) const;
  const std::vector<std::string>* standards_for(std::string_view cas) const;
  const ContributionRecord* find_contribution(std::string_view key) const;

  bool is_mapped(std::string_view key) const { return standards_for(key) != nullptr; }
  bool is_decomposable(std::string_view key) const { return find_contribution(key) != nullptr; }

  const KeyedMap<Standard>& standards() const noexcept { return standards_; }
  const KeyedMap<std::vector<std::string>>& cas_mapping() const noexcept { return cas_mapping_; }
  const KeyedMap<ContributionRecord>& contributions() const noexcept { return contributions_; }

  // Fingerprint of the normalized tables (independent of source key order).
  Hash64 fingerprint() const noexcept { return fingerprint_; }

 private:
  KeyedMap<Standard> standards_;
  KeyedMap<std::vector<std::string>> cas_mapping_;
  KeyedMap<ContributionRecord> contributions_;
  Hash64 fingerprint_{};
};

} // namespace ifra
