#include "ifra/report/text_report.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <vector>

#include "ifra/core/numeric.hpp"

namespace ifra {

namespace {

constexpr int kWidth = 94;
constexpr double kShowConcentration = 1e-6;

std::string rule(char c) { return std::string(kWidth, c); }

std::string fixed(double v, int places) {
  std::ostringstream o;
  o << std::fixed << std::setprecision(places) << v;
  return o.str();
}

std::string limit_text(const StandardResult& s) {
  if (!s.limit) return "specification only";
  std::ostringstream o;
  o << *s.limit;
  return o.str();
}

std::string exceed_text(double pct) {
  return pct > 0.0 ? fixed(pct, 2) + "%" : "-";
}

std::string clip(const std::string& s, size_t n) {
  return s.size() > n ? s.substr(0, n) : s;
}

void write_list(std::ostream& os, const char* title, const std::vector<std::string>& items) {
  os << rule('-') << "\n" << title << "\n";
  for (const auto& m : items) os << " - " << m << "\n";
}

} // namespace

void write_text_report(std::ostream& os, const ComplianceResult& r) {
  os << "\n" << rule('=') << "\n";
  os << " IFRA CATEGORY 4 COMPLIANCE REPORT\n";
  os << rule('=') << "\n";

  os << "OVERALL STATUS: " << (r.is_compliant ? "PASS" : "!!! FAIL !!!") << "\n";
  os << "FINISHED PRODUCT CONCENTRATION: " << r.finished_dosage << "%\n";
  os << "CRITICAL COMPONENT: " << r.critical_component.value_or("None") << "\n";

  const std::string safe = fixed(round_to(r.max_safe_dosage, 4), 4);
  if (!r.is_compliant) {
    os << "RECOMMENDED DOSAGE FOR PASS: " << safe << "% (Concentrate)\n";
  } else {
    os << "MAX SAFE DOSAGE: " << safe << "% (Currently Safe)\n";
  }

  if (!r.unresolved_materials.empty()) {
    write_list(os, "WARNING: THE FOLLOWING MATERIALS WERE NOT FOUND IN THE DATABASE:",
               r.unresolved_materials);
    os << "COLLECTIVE COMPLIANCE CANNOT BE FULLY GUARANTEED.\n";
  }
  if (!r.truncated_materials.empty()) {
    write_list(os, "WARNING: NESTED COMPOSITION TRUNCATED AT THE DEPTH LIMIT FOR:",
               r.truncated_materials);
  }
  if (!r.data_integrity_warnings.empty()) {
    write_list(os, "DATA INTEGRITY WARNINGS (Check for incomplete composition data):",
               r.data_integrity_warnings);
  }

  os << rule('-') << "\n";
  os << std::left
     << std::setw(35) << "Standard Name" << " | "
     << std::setw(10) << "Conc (%)" << " | "
     << std::setw(18) << "Limit" << " | "
     << std::setw(6) << "Ratio" << " | "
     << "Exceed %\n";
  os << rule('-') << "\n";

  std::vector<const StandardResult*> rows;
  rows.reserve(r.results.size());
  for (const auto& s : r.results) rows.push_back(&s);
  // Stable: equal ratios keep standard-id order.
  std::stable_sort(rows.begin(), rows.end(),
                   [](const StandardResult* a, const StandardResult* b) { return a->ratio > b->ratio; });

  for (const StandardResult* s : rows) {
    if (s->pass && !(s->concentration > kShowConcentration)) continue;
    os << (s->pass ? "\xE2\x9C\x93 " : "\xE2\x9C\x97 ")
       << std::left
       << std::setw(33) << clip(s->standard_name, 32) << " | "
       << std::setw(10) << fixed(s->concentration, 6) << " | "
       << std::setw(18) << limit_text(*s) << " | "
       << std::setw(6) << fixed(s->ratio, 2) << " | "
       << exceed_text(s->exceedance_pct) << "\n";
  }

  os << rule('-') << "\n";
  os << (r.phototoxicity.pass ? "\xE2\x9C\x93" : "\xE2\x9C\x97")
     << " PHOTOTOXICITY (Sum of Ratios): " << fixed(r.phototoxicity.sum_of_ratios, 4)
     << " (Limit: " << r.phototoxicity.limit << ") | Exceed: " << exceed_text(r.phototoxicity.exceedance_pct) << "\n";
  os << "REFERENCE FINGERPRINT: " << hash_to_hex(r.reference_fingerprint) << "\n";
  os << rule('=') << "\n\n";
}

std::string text_report(const ComplianceResult& r) {
  std::ostringstream os;
  write_text_report(os, r);
  return os.str();
}

} // namespace ifra
