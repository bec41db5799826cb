/*
  Report Writers Selftest

  Objective
  ---------
  Framework-free selftest for the result writers:
    1) JSON never contains NaN/Inf literals (infinite ratio -> null) and
       parses back with the project's own reader.
    2) Specification-only limits serialize as "specification only"; the
       file writer produces the same bytes as the string writer.
    3) CSV rows are escaped and keep standard-id order.
    4) Text report sorts by ratio, hides negligible passing rows and switches
       between recommended and maximum safe dosage wording.

  Non-zero return code indicates failure.
*/

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include "ifra/core/json.hpp"
#include "ifra/report/result_csv.hpp"
#include "ifra/report/result_json.hpp"
#include "ifra/report/text_report.hpp"

namespace ifra {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

bool contains(const std::string& hay, std::string_view needle) {
  return hay.find(needle) != std::string::npos;
}

StandardResult row(const std::string& id, const std::string& name, double conc, std::optional<double> limit,
                   double ratio, bool ok) {
  StandardResult s;
  s.standard_id = id;
  s.standard_name = name;
  s.concentration = conc;
  s.limit = limit;
  s.ratio = ratio;
  s.pass = ok;
  s.exceedance_pct = ratio > 1.0 ? (ratio - 1.0) * 100.0 : 0.0;
  return s;
}

ComplianceResult failing_result() {
  ComplianceResult r;
  r.is_compliant = false;
  r.finished_dosage = 20.0;

  StandardResult a = row("A1", "Citral, natural", 0.5, 1.0, 0.5, true);
  a.sources["Lemon Oil"] = 0.5;
  StandardResult b = row("B2", "Benzyl benzoate", 3.0, std::nullopt, 0.0, true);
  StandardResult c = row("C3", "Oakmoss", 0.2, 0.1, 2.0, false);
  c.sources["Oakmoss Abs \"EU\""] = 0.2;
  StandardResult d = row("D4", "Trace", 1e-9, 1.0, 1e-9, true);
  StandardResult z = row("Z9", "Zero limit", 0.01, 0.0, std::numeric_limits<double>::infinity(), false);

  r.results = {a, b, c, d, z};
  r.phototoxicity.sum_of_ratios = 0.25;
  r.critical_component = "Zero limit";
  r.max_ratio = std::numeric_limits<double>::infinity();
  r.max_safe_dosage = 0.0;
  r.unresolved_materials = {"Mystery Base"};
  r.data_integrity_warnings = {"Thin Base (Composition only totals 10.0%)"};
  r.truncated_materials = {"cycle b"};
  return r;
}

void test_json_writer() {
  const std::string j = result_to_json(failing_result());

  expect_true(!contains(j, "nan") && !contains(j, "inf"), "JSON: no NaN/Inf literals");
  expect_true(contains(j, "\"limit\": \"specification only\""), "JSON: spec-only limit string");
  expect_true(contains(j, "\"max_ratio\": null"), "JSON: infinite max ratio is null");

  ComplianceResult strict = failing_result();
  strict.phototoxicity.limit = 0.5;
  JsonValue sv;
  JsonParseError serr;
  expect_true(parse_json(result_to_json(strict), &sv, &serr), "JSON: strict-limit result parses");
  const JsonValue* photo = sv.find("phototoxicity");
  const JsonValue* plimit = photo ? photo->find("limit") : nullptr;
  expect_true(plimit && plimit->is_number() && plimit->number == 0.5, "JSON: phototoxicity limit emitted");

  JsonValue v;
  JsonParseError err;
  expect_true(parse_json(j, &v, &err), "JSON: writer output parses");
  const JsonValue* results = v.find("results");
  expect_true(results && results->is_array() && results->array.size() == 5, "JSON: all standards emitted");
  if (results && results->array.size() == 5) {
    const JsonValue* ratio = results->array[4].find("ratio");
    expect_true(ratio && ratio->is_null(), "JSON: infinite ratio is null");
    const JsonValue* src = results->array[2].find("sources");
    expect_true(src && src->find("Oakmoss Abs \"EU\"") != nullptr, "JSON: escaped source name round-trips");
  }
  const JsonValue* fp = v.find("reference_fingerprint");
  expect_true(fp && fp->is_string() && fp->str.size() == 16, "JSON: fingerprint hex string");

  ComplianceResult empty;
  JsonValue e;
  expect_true(parse_json(result_to_json(empty), &e, &err), "JSON: empty result parses");
  const JsonValue* crit = e.find("critical_component");
  expect_true(crit && crit->is_null(), "JSON: absent critical component is null");

  expect_true(result_to_json(failing_result()) == j, "JSON: output deterministic");
}

void test_json_file_writer() {
  namespace fs = std::filesystem;
  const fs::path path = fs::temp_directory_path() / "ifra_report_selftest_result.json";
  const ComplianceResult r = failing_result();

  expect_true(write_result_json_file(r, path.string()), "JSON file: written");
  std::ifstream in(path, std::ios::binary);
  const std::string back((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  expect_true(back == result_to_json(r), "JSON file: content matches the string writer");

  expect_true(!write_result_json_file(r, (fs::temp_directory_path() / "ifra_no_such_dir" / "r.json").string()),
              "JSON file: unwritable path reports failure");

  in.close();
  std::error_code ec;
  fs::remove(path, ec);
}

void test_csv_writer() {
  std::ostringstream os;
  write_result_csv(os, failing_result());
  const std::string csv = os.str();

  std::istringstream in(csv);
  std::string header, first, second;
  std::getline(in, header);
  std::getline(in, first);
  std::getline(in, second);

  expect_true(header == "standard_id,standard_name,type,concentration,limit,pass,ratio,exceedance_pct,sources",
              "CSV: header");
  expect_true(first == "A1,\"Citral, natural\",restriction,0.5,1,true,0.5,0,Lemon Oil=0.5",
              "CSV: comma in name quoted");
  expect_true(second == "B2,Benzyl benzoate,restriction,3,,true,0,0,", "CSV: spec-only limit empty");
  expect_true(contains(csv, "\"Oakmoss Abs \"\"EU\"\"=0.2\""), "CSV: embedded quotes doubled");
  expect_true(contains(csv, "Z9,Zero limit,restriction,0.01,0,false,inf,inf,"), "CSV: infinite ratio as inf");
}

void test_text_report() {
  const std::string t = text_report(failing_result());

  expect_true(contains(t, "OVERALL STATUS: !!! FAIL !!!"), "Text: failing status");
  expect_true(contains(t, "RECOMMENDED DOSAGE FOR PASS: 0.0000%"), "Text: recommended dosage when failing");
  expect_true(contains(t, "CRITICAL COMPONENT: Zero limit"), "Text: critical component");
  expect_true(contains(t, " - Mystery Base"), "Text: unresolved listed");
  expect_true(contains(t, " - cycle b"), "Text: truncated listed");
  expect_true(contains(t, " - Thin Base (Composition only totals 10.0%)"), "Text: integrity warning listed");
  expect_true(!contains(t, "Trace"), "Text: negligible passing row hidden");
  expect_true(contains(t, "specification only"), "Text: specification-only limit shown");
  expect_true(contains(t, "| specification only | "), "Text: limit column fits the full label");
  expect_true(contains(t, "(Limit: 1) | Exceed: -"), "Text: default phototoxicity limit shown");

  ComplianceResult strict = failing_result();
  strict.phototoxicity.limit = 0.5;
  strict.phototoxicity.pass = true;
  expect_true(contains(text_report(strict), "(Limit: 0.5)"), "Text: configured phototoxicity limit shown");

  const size_t zero = t.find("Zero limit  ");
  const size_t oak = t.find("Oakmoss ");
  const size_t citral = t.find("Citral, natural");
  const size_t benzyl = t.find("Benzyl benzoate");
  expect_true(zero < oak && oak < citral && citral < benzyl, "Text: rows sorted by ratio descending");
  expect_true(contains(t, "100.00%"), "Text: exceedance with 2 decimals");
  expect_true(contains(t, "0.200000"), "Text: concentration with 6 decimals");

  ComplianceResult ok;
  ok.finished_dosage = 10.0;
  ok.max_safe_dosage = 25.0;
  ok.critical_component = "Linalool";
  const std::string s = text_report(ok);
  expect_true(contains(s, "OVERALL STATUS: PASS"), "Text: passing status");
  expect_true(contains(s, "MAX SAFE DOSAGE: 25.0000% (Currently Safe)"), "Text: max safe dosage when passing");
  expect_true(!contains(s, "NOT FOUND"), "Text: no unresolved block when empty");
}

}  // namespace
}  // namespace ifra

int main() {
  using namespace ifra;

  test_json_writer();
  test_json_file_writer();
  test_csv_writer();
  test_text_report();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
