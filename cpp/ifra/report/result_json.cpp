/*
================================================================================
Report: Compliance Result JSON Serializer (Implementation)
FILE: cpp/ifra/report/result_json.cpp
================================================================================
*/

#include "ifra/report/result_json.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include "ifra/core/numeric.hpp"

namespace ifra {

static std::string json_escape(const std::string& s) {
  std::ostringstream o;
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          o << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(static_cast<unsigned char>(c))
            << std::dec << std::setfill(' ');
        } else {
          o << c;
        }
    }
  }
  o << '"';
  return o.str();
}

struct J {
  std::ostringstream out;
  int indent = 2;
  int level = 0;

  void nl() { out << "\n" << std::string(level * indent, ' '); }

  void obj_begin() { out << "{"; level++; }
  void obj_end(bool empty = false) {
    level--;
    if (!empty) nl();
    out << "}";
  }

  void arr_begin() { out << "["; level++; }
  void arr_end(bool empty) {
    level--;
    if (!empty) nl();
    out << "]";
  }

  void key(const std::string& k) { out << json_escape(k) << ": "; }
  void comma() { out << ","; }

  void str(const std::string& v) { out << json_escape(v); }
  void b(bool v) { out << (v ? "true" : "false"); }
  void n_null() { out << "null"; }

  void num(double v) {
    if (!is_finite(v)) { n_null(); return; }
    out << std::setprecision(17) << v;
  }
};

static void emit_string_array(J& j, const std::vector<std::string>& v) {
  j.arr_begin();
  for (size_t i = 0; i < v.size(); ++i) {
    j.nl(); j.str(v[i]);
    if (i + 1 < v.size()) j.comma();
  }
  j.arr_end(v.empty());
}

static void emit_standard(J& j, const StandardResult& s) {
  j.obj_begin(); j.nl();
  j.key("standard_id"); j.str(s.standard_id); j.comma(); j.nl();
  j.key("standard_name"); j.str(s.standard_name); j.comma(); j.nl();
  j.key("type"); j.str(to_string(s.type)); j.comma(); j.nl();
  j.key("concentration"); j.num(s.concentration); j.comma(); j.nl();
  j.key("limit");
  if (s.limit) j.num(*s.limit); else j.str("specification only");
  j.comma(); j.nl();
  j.key("pass"); j.b(s.pass); j.comma(); j.nl();
  j.key("ratio"); j.num(s.ratio); j.comma(); j.nl();
  j.key("exceedance_pct"); j.num(s.exceedance_pct); j.comma(); j.nl();
  j.key("sources"); j.obj_begin();
  size_t i = 0;
  for (const auto& [name, conc] : s.sources) {
    j.nl(); j.key(name); j.num(conc);
    if (++i < s.sources.size()) j.comma();
  }
  j.obj_end(s.sources.empty());

  j.obj_end();
}

std::string result_to_json(const ComplianceResult& r, int indent_spaces) {
  J j;
  j.indent = indent_spaces;

  j.obj_begin(); j.nl();

  j.key("is_compliant"); j.b(r.is_compliant); j.comma(); j.nl();
  j.key("finished_dosage"); j.num(r.finished_dosage); j.comma(); j.nl();

  j.key("critical_component");
  if (r.critical_component) j.str(*r.critical_component); else j.n_null();
  j.comma(); j.nl();
  j.key("max_ratio"); j.num(r.max_ratio); j.comma(); j.nl();
  j.key("max_safe_dosage"); j.num(r.max_safe_dosage); j.comma(); j.nl();

  j.key("phototoxicity"); j.obj_begin(); j.nl();
  j.key("sum_of_ratios"); j.num(r.phototoxicity.sum_of_ratios); j.comma(); j.nl();
  j.key("limit"); j.num(r.phototoxicity.limit); j.comma(); j.nl();
  j.key("pass"); j.b(r.phototoxicity.pass); j.comma(); j.nl();
  j.key("exceedance_pct"); j.num(r.phototoxicity.exceedance_pct);
  j.obj_end(); j.comma(); j.nl();

  j.key("results"); j.arr_begin();
  for (size_t i = 0; i < r.results.size(); ++i) {
    j.nl(); emit_standard(j, r.results[i]);
    if (i + 1 < r.results.size()) j.comma();
  }
  j.arr_end(r.results.empty()); j.comma(); j.nl();

  j.key("unresolved_materials"); emit_string_array(j, r.unresolved_materials); j.comma(); j.nl();
  j.key("data_integrity_warnings"); emit_string_array(j, r.data_integrity_warnings); j.comma(); j.nl();
  j.key("truncated_materials"); emit_string_array(j, r.truncated_materials); j.comma(); j.nl();

  j.key("reference_fingerprint"); j.str(hash_to_hex(r.reference_fingerprint));

  j.obj_end();
  j.out << "\n";
  return j.out.str();
}

bool write_result_json_file(const ComplianceResult& r,
                            const std::string& file_path,
                            int indent_spaces) {
  std::ofstream f(file_path, std::ios::binary | std::ios::trunc);
  if (!f.is_open()) return false;
  f << result_to_json(r, indent_spaces);
  f.close();
  return !f.fail();
}

} // namespace ifra
