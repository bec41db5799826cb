/*
  Reference Data JSON Selftest

  Objective
  ---------
  Framework-free selftest for the reference tables and their JSON loaders:
    1) Standards / CAS mapping / contributions parse into normalized tables.
    2) Schema violations fail with a line/column position.
    3) The fingerprint ignores source key order and tracks content.
    4) File loading raises Error(kIoError / kParseError).
    5) Engine settings load from JSON and reject bad values.
    6) Material search is case-insensitive and limited.

  Non-zero return code indicates failure.
*/

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include "ifra/core/error.hpp"
#include "ifra/core/json.hpp"
#include "ifra/core/logging.hpp"
#include "ifra/core/settings.hpp"
#include "ifra/refdata/material_search.hpp"
#include "ifra/refdata/refdata_json.hpp"

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

const char* kStandards = R"json({
  "metadata": {
    "IFRA_LIM": {"name": "Limonene", "type": "RESTRICTION", "limit_cat4": 2.0},
    "IFRA_BRG": {"name": "Bergapten", "type": "Phototoxicity (sum of ratios)", "limit_cat4": 0.1},
    "IFRA_SPC": {"name": "Benzyl benzoate", "type": "SPECIFICATION", "limit_cat4": null},
    "IFRA_NONAME": {"type": "RESTRICTION"}
  },
  "cas_mapping": {
    " 5989-27-5 ": ["IFRA_LIM", "IFRA_LIM"],
    "484-20-8": ["IFRA_BRG"]
  },
  "version": "51"
})json";

const char* kContributions = R"json({
  "Orange Oil": {"name": "Orange Oil Brazil", "constituents": {"5989-27-5": 90, "484-20-8": 0.5}},
  "bergamot": {"constituents": {"484-20-8": 0.3}},
  "Hedione": {"name": "Hedione"}
})json";

// Same content, different key order and spacing.
const char* kContributionsReordered = R"json({"Hedione":{"name":"Hedione"},
 "bergamot":{"constituents":{"484-20-8":0.3}},
 "Orange Oil":{"constituents":{"484-20-8":0.5,"5989-27-5":90},"name":"Orange Oil Brazil"}})json";

ReferenceData parse_both(const char* standards, const char* contributions) {
  ReferenceTables t;
  JsonParseError err;
  if (!parse_standards_json(standards, &t, &err)) fail("fixture standards must parse: " + err.message);
  if (!parse_contributions_json(contributions, &t, &err)) fail("fixture contributions must parse: " + err.message);
  return ReferenceData(std::move(t));
}

void test_json_reader() {
  JsonValue v;
  JsonParseError err;
  expect_true(parse_json(R"json({"a": [1, 2.5e1, true, null, "x\u0041"]})json", &v, &err), "JSON: valid document parses");
  const JsonValue* a = v.find("a");
  expect_true(a && a->is_array() && a->array.size() == 5, "JSON: array preserved");
  if (a && a->array.size() == 5) {
    expect_true(a->array[1].number == 25.0, "JSON: exponent number");
    expect_true(a->array[4].str == "xA", "JSON: unicode escape");
  }

  expect_true(!parse_json("{\n  \"a\": 1,\n  \"b\": }", &v, &err), "JSON: missing value rejected");
  expect_true(err.line == 3, "JSON: error line reported");

  expect_true(!parse_json("[1] trailing", &v, &err), "JSON: trailing characters rejected");
  expect_true(!parse_json("{\"a\": NaN}", &v, &err), "JSON: NaN literal rejected");
}

void test_parse_tables() {
  const ReferenceData d = parse_both(kStandards, kContributions);

  const Standard* lim = d.find_standard("IFRA_LIM");
  expect_true(lim && lim->type == StandardType::kRestriction && lim->limit_cat4 && *lim->limit_cat4 == 2.0,
              "Standards: restriction with limit");
  const Standard* brg = d.find_standard("IFRA_BRG");
  expect_true(brg && brg->is_phototoxic(), "Standards: free-text phototoxicity type classified");
  const Standard* spc = d.find_standard("IFRA_SPC");
  expect_true(spc && spc->type == StandardType::kSpecification && !spc->limit_cat4,
              "Standards: null limit is specification only");
  const Standard* noname = d.find_standard("IFRA_NONAME");
  expect_true(noname && noname->name == "IFRA_NONAME" && !noname->limit_cat4, "Standards: name defaults to id");

  const std::vector<std::string>* ids = d.standards_for("5989-27-5");
  expect_true(ids && ids->size() == 1 && (*ids)[0] == "IFRA_LIM", "CAS mapping: key trimmed, duplicate id dropped");

  const ContributionRecord* orange = d.find_contribution("orange oil");
  expect_true(orange && orange->name == "Orange Oil Brazil" && orange->constituents.size() == 2,
              "Contributions: key normalized, name kept");
  const ContributionRecord* berg = d.find_contribution("bergamot");
  expect_true(berg && berg->name == "bergamot", "Contributions: name defaults to key");
  const ContributionRecord* hed = d.find_contribution("hedione");
  expect_true(hed && hed->constituents.empty() && hed->documented_pct() == 0.0,
              "Contributions: absent constituents is an empty composition");

  expect_true(d.is_mapped("484-20-8") && !d.is_decomposable("484-20-8"), "Lookup: CAS mapped, not decomposable");
  expect_true(d.is_decomposable("orange oil") && !d.is_mapped("orange oil"), "Lookup: material decomposable");
}

void test_colliding_contribution_keys() {
  // Both orders of the file keep the record whose raw key sorts first.
  const ReferenceData a = parse_both(
      kStandards,
      R"json({"rose": {"name": "Rose B", "constituents": {"x": 10}}, "Rose": {"name": "Rose A", "constituents": {"x": 20}}})json");
  const ReferenceData b = parse_both(
      kStandards,
      R"json({"Rose": {"name": "Rose A", "constituents": {"x": 20}}, "rose": {"name": "Rose B", "constituents": {"x": 10}}})json");

  const ContributionRecord* ra = a.find_contribution("rose");
  const ContributionRecord* rb = b.find_contribution("rose");
  expect_true(a.contributions().size() == 1 && ra && ra->name == "Rose A",
              "Contributions: colliding keys keep the byte-wise smallest raw key");
  expect_true(rb && rb->name == "Rose A" && a.fingerprint() == b.fingerprint(),
              "Contributions: collision outcome independent of file order");
}

void test_schema_errors() {
  ReferenceTables t;
  JsonParseError err;

  expect_true(!parse_standards_json(R"json({"metadata": {"A": {"name": "A", "type": "RESTRICTION", "limit_cat4": -1}}})json",
                                    &t, &err),
              "Schema: negative limit rejected");
  expect_true(err.message.find("limit_cat4") != std::string::npos, "Schema: error names the field");

  expect_true(!parse_standards_json(R"json({"metadata": {"A": {"name": "A", "limit_cat4": 1}}})json", &t, &err),
              "Schema: missing type rejected");

  expect_true(!parse_standards_json(R"json({"cas_mapping": {"1-1-1": "A"}})json", &t, &err),
              "Schema: mapping value must be an array");

  expect_true(!parse_contributions_json("{\n\"m\": {\"constituents\": {\"x\": 101}}}", &t, &err),
              "Schema: percentage above 100 rejected");
  expect_true(err.line == 2, "Schema: error position points at the value");

  expect_true(!parse_contributions_json(R"json({"m": {"constituents": {"x": "5"}}})json", &t, &err),
              "Schema: string percentage rejected");
  expect_true(!parse_contributions_json("[]", &t, &err), "Schema: root must be an object");
}

void test_fingerprint() {
  const ReferenceData a = parse_both(kStandards, kContributions);
  const ReferenceData b = parse_both(kStandards, kContributionsReordered);
  expect_true(a.fingerprint() == b.fingerprint(), "Fingerprint: independent of key order");

  const ReferenceData c = parse_both(kStandards, R"json({"Orange Oil": {"constituents": {"5989-27-5": 91}}})json");
  expect_true(a.fingerprint() != c.fingerprint(), "Fingerprint: tracks content");
  expect_true(hash_to_hex(a.fingerprint()).size() == 16, "Fingerprint: 16 hex digits");
}

void test_load_files() {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path();
  const fs::path std_path = dir / "ifra_refdata_selftest_standards.json";
  const fs::path con_path = dir / "ifra_refdata_selftest_contributions.json";
  const fs::path bad_path = dir / "ifra_refdata_selftest_bad.json";

  { std::ofstream(std_path) << kStandards; }
  { std::ofstream(con_path) << kContributions; }
  { std::ofstream(bad_path) << "{\"m\": {\"constituents\": [1]}}"; }

  const auto data = load_reference_data(std_path.string(), con_path.string());
  expect_true(data && data->standards().size() == 4 && data->contributions().size() == 3,
              "Load: both files loaded");

  const auto contrib_only = load_reference_data("", con_path.string());
  expect_true(contrib_only->standards().empty() && contrib_only->contributions().size() == 3,
              "Load: contributions without standards");

  bool threw = false;
  try {
    (void)load_reference_data(std_path.string(), (dir / "ifra_missing_file.json").string());
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kIoError;
  }
  expect_true(threw, "Load: missing file raises kIoError");

  threw = false;
  try {
    (void)load_reference_data(std_path.string(), bad_path.string());
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kParseError && e.message().find("@ 1:") != std::string::npos;
  }
  expect_true(threw, "Load: schema error raises kParseError with position");

  std::error_code ec;
  fs::remove(std_path, ec);
  fs::remove(con_path, ec);
  fs::remove(bad_path, ec);
}

void test_settings_json() {
  const EngineSettings s = settings_from_json(
      R"json({"resolution": {"max_depth": 4},
          "evaluation": {"phototoxicity_sum_limit": 0.5},
          "exemption": {"phototoxicity_exempt_tokens": ["BERGAPTENE-FREE"]},
          "future": {"ignored": true}})json");
  expect_true(s.resolution.max_depth == 4, "Settings: max_depth override");
  expect_true(s.evaluation.phototoxicity_sum_limit == 0.5, "Settings: sum limit override");
  expect_true(s.exemption.phototoxicity_exempt_tokens.size() == 1, "Settings: token list replaced");
  expect_true(s.integrity.min_documented_pct == 90.0, "Settings: untouched defaults kept");

  bool threw = false;
  try {
    (void)settings_from_json(R"json({"resolution": {"max_depth": -1}})json");
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kInvalidArgument;
  }
  expect_true(threw, "Settings: negative depth rejected");

  threw = false;
  try {
    (void)settings_from_json(R"json({"evaluation": {"pass_tolerance": "tiny"}})json");
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kParseError;
  }
  expect_true(threw, "Settings: wrong type is a parse error");
}

void test_material_search() {
  const ReferenceData d = parse_both(kStandards, kContributions);

  const MaterialSearchResult r = search_materials(d, "ORANGE");
  expect_true(r.total == 1 && r.matches.size() == 1 && r.matches[0].key == "orange oil",
              "Search: case-insensitive key match");

  const MaterialSearchResult by_name = search_materials(d, "brazil");
  expect_true(by_name.total == 1, "Search: display name match");

  const MaterialSearchResult all = search_materials(d, "e", 2);
  expect_true(all.total == 3 && all.matches.size() == 2 && all.matches[0].key == "bergamot",
              "Search: limited and sorted by key");

  expect_true(search_materials(d, "   ").total == 0, "Search: blank query matches nothing");
}

}  // namespace
}  // namespace ifra

int main() {
  using namespace ifra;

  set_log_level(LogLevel::ERROR);

  test_json_reader();
  test_parse_tables();
  test_colliding_contribution_keys();
  test_schema_errors();
  test_fingerprint();
  test_load_files();
  test_settings_json();
  test_material_search();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
