#include "ifra/refdata/reference_data.hpp"

#include <algorithm>
#include <utility>

#include "ifra/core/error.hpp"
#include "ifra/core/logging.hpp"
#include "ifra/core/numeric.hpp"
#include "ifra/core/text.hpp"

namespace ifra {

const char* to_string(StandardType t) noexcept {
  switch (t) {
    case StandardType::kRestriction:   return "restriction";
    case StandardType::kPhototoxicity: return "phototoxicity";
    case StandardType::kSpecification: return "specification";
    default:                           return "restriction";
  }
}

StandardType classify_standard_type(std::string_view raw) {
  if (contains_icase(raw, "PHOTOTOXICITY")) return StandardType::kPhototoxicity;
  if (contains_icase(raw, "SPECIFICATION")) return StandardType::kSpecification;
  return StandardType::kRestriction;
}

void Standard::validate() const {
  IFRA_ENSURE(!id.empty(), ErrorCode::kInvalidArgument, "Standard.id empty");
  if (limit_cat4) {
    IFRA_ENSURE(is_finite_nonneg(*limit_cat4), ErrorCode::kInvalidArgument,
                "Standard " + id + ": limit_cat4 must be a finite non-negative number");
  }
}

double ContributionRecord::documented_pct() const noexcept {
  double sum = 0.0;
  for (const auto& c : constituents) sum += c.percent;
  return sum;
}

void ContributionRecord::validate() const {
  IFRA_ENSURE(!key.empty(), ErrorCode::kInvalidArgument, "ContributionRecord.key empty");
  for (const auto& c : constituents) {
    IFRA_ENSURE(!c.key.empty(), ErrorCode::kInvalidArgument,
                "ContributionRecord " + key + ": empty constituent key");
    IFRA_ENSURE(is_finite(c.percent) && c.percent >= 0.0 && c.percent <= 100.0, ErrorCode::kInvalidArgument,
                "ContributionRecord " + key + ": constituent " + c.key + " percentage outside [0,100]");
  }
}

namespace {

// Merge constituents whose keys collide after normalization (percentages add).
std::vector<Constituent> normalize_constituents(const std::vector<Constituent>& in) {
  std::map<std::string, double> merged;
  for (const auto& c : in) {
    merged[normalize_key(c.key)] += c.percent;
  }
  std::vector<Constituent> out;
  out.reserve(merged.size());
  for (auto& [k, pct] : merged) {
    out.push_back(Constituent{k, pct});
  }
  return out;
}

Hash64 fingerprint_tables(const ReferenceData& d) {
  Fnv1a64 h;
  h.add(static_cast<uint64_t>(d.standards().size()));
  for (const auto& [id, s] : d.standards()) {
    h.add(std::string_view(id)).add(std::string_view(s.name)).add(static_cast<uint64_t>(s.type));
    h.add(s.limit_cat4.has_value());
    if (s.limit_cat4) h.add(*s.limit_cat4);
  }
  h.add(static_cast<uint64_t>(d.cas_mapping().size()));
  for (const auto& [cas, ids] : d.cas_mapping()) {
    h.add(std::string_view(cas)).add(static_cast<uint64_t>(ids.size()));
    for (const auto& id : ids) h.add(std::string_view(id));
  }
  h.add(static_cast<uint64_t>(d.contributions().size()));
  for (const auto& [key, rec] : d.contributions()) {
    h.add(std::string_view(key)).add(std::string_view(rec.name)).add(static_cast<uint64_t>(rec.constituents.size()));
    for (const auto& c : rec.constituents) {
      h.add(std::string_view(c.key)).add(c.percent);
    }
  }
  return h.digest();
}

} // namespace

ReferenceData::ReferenceData(ReferenceTables tables) {
  for (auto& [id, s] : tables.standards) {
    if (s.id.empty()) s.id = id;
    IFRA_ENSURE(s.id == id, ErrorCode::kInvalidArgument, "Standard id mismatch for table key " + id);
    if (s.name.empty()) s.name = id;
    s.validate();
    standards_.emplace(id, std::move(s));
  }

  for (auto& [raw_cas, ids] : tables.cas_mapping) {
    const std::string cas = normalize_key(raw_cas);
    IFRA_ENSURE(!cas.empty(), ErrorCode::kInvalidArgument, "CAS mapping has an empty key");
    auto& dst = cas_mapping_[cas];
    for (auto& id : ids) {
      if (std::find(dst.begin(), dst.end(), id) == dst.end()) dst.push_back(std::move(id));
    }
  }

  // Raw keys arrive in byte order, so of several keys that normalize alike
  // the byte-wise smallest one wins.
  for (auto& [raw_key, rec] : tables.contributions) {
    const std::string key = normalize_key(raw_key);
    const auto kept = contributions_.find(key);
    if (kept != contributions_.end()) {
      log(LogLevel::WARN, "contributions: '" + raw_key + "' normalizes to '" + key +
                              "' already loaded as '" + kept->second.name + "', dropped");
      continue;
    }
    rec.key = key;
    if (rec.name.empty()) rec.name = raw_key;
    rec.constituents = normalize_constituents(rec.constituents);
    rec.validate();
    contributions_.emplace(key, std::move(rec));
  }

  fingerprint_ = fingerprint_tables(*this);
}

const Standard* ReferenceData::find_standard(std::string_view id) const {
  const auto it = standards_.find(id);
  return (it == standards_.end()) ? nullptr : &it->second;
}

const std::vector<std::string>* ReferenceData::standards_for(std::string_view cas) const {
  const auto it = cas_mapping_.find(cas);
  return (it == cas_mapping_.end()) ? nullptr : &it->second;
}

const ContributionRecord* ReferenceData::find_contribution(std::string_view key) const {
  const auto it = contributions_.find(key);
  return (it == contributions_.end()) ? nullptr : &it->second;
}

} // namespace ifra
