// ============================================================================
// Compliance Result CSV Writer
// File: cpp/ifra/report/result_csv.cpp
// ============================================================================

#include "ifra/report/result_csv.hpp"

#include <ostream>
#include <sstream>
#include <string>

#include "ifra/core/numeric.hpp"

namespace ifra {

namespace {

std::string csv_escape(const std::string& s) {
  bool need_quotes = false;
  for (char c : s) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      need_quotes = true;
      break;
    }
  }
  if (!need_quotes) return s;

  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('"');
  for (char c : s) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

std::string fmt(double v) {
  if (!is_finite(v)) return v > 0 ? "inf" : "nan";
  std::ostringstream o;
  o.precision(10);
  o << v;
  return o.str();
}

std::string join_sources(const SourceMap& sources) {
  std::string out;
  for (const auto& [name, conc] : sources) {
    if (!out.empty()) out.push_back(';');
    out += name;
    out.push_back('=');
    out += fmt(conc);
  }
  return out;
}

} // namespace

void write_result_csv(std::ostream& os, const ComplianceResult& r) {
  os << "standard_id,standard_name,type,concentration,limit,pass,ratio,exceedance_pct,sources\n";
  for (const auto& s : r.results) {
    os << csv_escape(s.standard_id) << ","
       << csv_escape(s.standard_name) << ","
       << to_string(s.type) << ","
       << fmt(s.concentration) << ","
       << (s.limit ? fmt(*s.limit) : std::string{}) << ","
       << (s.pass ? "true" : "false") << ","
       << fmt(s.ratio) << ","
       << fmt(s.exceedance_pct) << ","
       << csv_escape(join_sources(s.sources)) << "\n";
  }
}

} // namespace ifra
