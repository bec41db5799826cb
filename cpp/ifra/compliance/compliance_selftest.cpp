/*
  Compliance Engine Selftest

  Objective
  ---------
  Framework-free selftest for the compliance pipeline:
    1) Constituent resolution is C * P / 100, nested levels multiply.
    2) Cyclic compositions terminate and report truncation.
    3) Any permutation of a formula gives an identical result.
    4) Amount normalization (50/50 at 20% => 10% each).
    5) Phototoxicity exemption removes a material from the sum of ratios only.
    6) Re-running at max_safe_dosage puts the critical ratio at 1.0.
    7) Unresolved materials are listed once and contribute nothing.
    8) Direct-standard scenario: ratio 5, exceedance 400%, max safe dosage 20.
    9) Invalid numeric input raises Error(kInvalidNumeric) naming the entry.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "ifra/compliance/aggregator.hpp"
#include "ifra/compliance/compliance_engine.hpp"
#include "ifra/compliance/evaluator.hpp"
#include "ifra/compliance/heuristics.hpp"
#include "ifra/compliance/integrity.hpp"
#include "ifra/compliance/resolver.hpp"
#include "ifra/core/error.hpp"
#include "ifra/core/logging.hpp"
#include "ifra/report/result_json.hpp"

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

void expect_near(double a, double b, double tol, std::string_view msg) {
  if (!(std::fabs(a - b) <= tol)) {
    fail(msg);
    std::cerr << "  got: " << a << " expected: " << b << "\n";
  } else {
    pass(msg);
  }
}

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    pass(msg);
  }
}

Standard make_standard(const std::string& id, const std::string& name, StandardType type,
                       std::optional<double> limit) {
  Standard s;
  s.id = id;
  s.name = name;
  s.type = type;
  s.limit_cat4 = limit;
  return s;
}

ContributionRecord make_record(const std::string& key, const std::string& name,
                               std::vector<Constituent> constituents) {
  ContributionRecord r;
  r.key = key;
  r.name = name;
  r.constituents = std::move(constituents);
  return r;
}

FormulaEntry by_amount(const std::string& name, double amount) {
  FormulaEntry e;
  e.name = name;
  e.quantity = ByAmount{amount};
  return e;
}

FormulaEntry by_percent(const std::string& name, double percent) {
  FormulaEntry e;
  e.name = name;
  e.quantity = ByConcentration{percent};
  return e;
}

const StandardResult* find_result(const ComplianceResult& r, const std::string& id) {
  for (const auto& s : r.results) {
    if (s.standard_id == id) return &s;
  }
  return nullptr;
}

// Shared fixture:
//   LIM  Limonene restriction, limit 2      <- cas 5989-27-5
//   LIN  Linalool restriction, limit 4      <- cas 78-70-6
//   BRG  Bergapten phototoxicity, limit 0.1 <- cas 484-20-8
//   CIT  Citral restriction, limit 1        <- cas 484-20-8 too
//   SPC  Benzyl benzoate specification      <- cas 120-51-4
//   X    direct standard, limit 20          <- key "x"
std::shared_ptr<const ReferenceData> make_reference() {
  ReferenceTables t;
  t.standards["LIM"] = make_standard("LIM", "Limonene", StandardType::kRestriction, 2.0);
  t.standards["LIN"] = make_standard("LIN", "Linalool", StandardType::kRestriction, 4.0);
  t.standards["BRG"] = make_standard("BRG", "Bergapten", StandardType::kPhototoxicity, 0.1);
  t.standards["CIT"] = make_standard("CIT", "Citral", StandardType::kRestriction, 1.0);
  t.standards["SPC"] = make_standard("SPC", "Benzyl benzoate", StandardType::kSpecification, std::nullopt);
  t.standards["XS"] = make_standard("XS", "X Standard", StandardType::kRestriction, 20.0);

  t.cas_mapping["5989-27-5"] = {"LIM"};
  t.cas_mapping["78-70-6"] = {"LIN"};
  t.cas_mapping["484-20-8"] = {"BRG", "CIT"};
  t.cas_mapping["120-51-4"] = {"SPC"};
  t.cas_mapping["X"] = {"XS"};

  t.contributions["orange oil"] =
      make_record("orange oil", "Orange Oil", {{"5989-27-5", 90.0}, {"78-70-6", 5.0}, {"484-20-8", 0.5}});
  t.contributions["bergamot oil"] =
      make_record("bergamot oil", "Bergamot Oil", {{"484-20-8", 0.3}, {"78-70-6", 20.0}, {"5989-27-5", 40.0}});
  t.contributions["citrus accord"] =
      make_record("citrus accord", "Citrus Accord", {{"orange oil", 50.0}, {"120-51-4", 50.0}});
  t.contributions["thin base"] =
      make_record("thin base", "Thin Base", {{"5989-27-5", 10.0}});

  // A <-> B cycle, each also carrying some limonene.
  t.contributions["cycle a"] = make_record("cycle a", "Cycle A", {{"cycle b", 50.0}, {"5989-27-5", 50.0}});
  t.contributions["cycle b"] = make_record("cycle b", "Cycle B", {{"cycle a", 50.0}, {"5989-27-5", 50.0}});

  return std::make_shared<ReferenceData>(std::move(t));
}

void test_resolution_multiplies_percentages() {
  const auto data = make_reference();
  const ContributionResolver resolver(*data, 10);

  const Resolution r = resolver.resolve("orange oil", 10.0);
  expect_near(r.contributions.at("5989-27-5"), 9.0, 1e-12, "Resolution: 10% orange oil gives 9% limonene");
  expect_near(r.contributions.at("78-70-6"), 0.5, 1e-12, "Resolution: 10% orange oil gives 0.5% linalool");

  const Resolution nested = resolver.resolve("citrus accord", 10.0);
  expect_near(nested.contributions.at("5989-27-5"), 4.5, 1e-12, "Resolution: nested levels multiply (10 * 50% * 90%)");
  expect_near(nested.contributions.at("120-51-4"), 5.0, 1e-12, "Resolution: mapped constituent of accord recorded");
  expect_true(nested.contributions.count("orange oil") == 0, "Resolution: decomposable-only key not recorded as leaf");
  expect_true(nested.truncated.empty(), "Resolution: shallow tree has no truncation");

  const Resolution unknown = resolver.resolve("nothing here", 10.0);
  expect_true(unknown.contributions.empty(), "Resolution: unknown material resolves to nothing");

  const ConstituentKind k = classify_constituent(*data, "orange oil");
  expect_true(k.decomposable && !k.mapped_standard && !k.leaf(), "Classify: orange oil is decomposable only");
  expect_true(classify_constituent(*data, "unknown-cas").leaf(), "Classify: unknown key is a leaf");
}

void test_cycle_terminates_with_truncation() {
  const auto data = make_reference();
  const ContributionResolver resolver(*data, 10);
  const Resolution r = resolver.resolve("cycle a", 100.0);

  expect_true(!r.truncated.empty(), "Cycle: truncation reported");
  const double limonene = r.contributions.at("5989-27-5");
  // Geometric series 50 + 25 + ... over 11 levels stays below 100.
  expect_true(std::isfinite(limonene) && limonene > 99.0 && limonene < 100.0,
              "Cycle: accumulated concentration is finite and bounded");

  ComplianceEngine engine(data);
  const ComplianceResult res = engine.calculate({by_percent("Cycle A", 1.0)}, 100.0);
  expect_true(!res.truncated_materials.empty(), "Cycle: engine surfaces truncated materials");

  EngineSettings shallow;
  shallow.resolution.max_depth = 0;
  const ContributionResolver flat(*data, shallow.resolution.max_depth);
  const Resolution f = flat.resolve("citrus accord", 10.0);
  expect_true(f.truncated.size() == 1 && f.truncated[0] == "orange oil",
              "Depth 0: first decomposable constituent is truncated");
}

void test_permutation_invariance() {
  ComplianceEngine engine(make_reference());

  std::vector<FormulaEntry> f = {
    by_amount("Orange Oil", 13.7),
    by_amount("Bergamot Oil", 3.3),
    by_amount("Citrus Accord", 7.1),
    by_amount("Unknown Musk", 2.9),
    by_amount("Bergamot Oil FCF", 1.1),
  };
  f[1].cas = std::string{};

  const std::string j0 = result_to_json(engine.calculate(f, 17.0));

  std::vector<FormulaEntry> rev(f.rbegin(), f.rend());
  std::vector<FormulaEntry> rot = {f[2], f[4], f[0], f[3], f[1]};

  expect_eq_str(result_to_json(engine.calculate(rev, 17.0)), j0, "Permutation: reversed formula identical");
  expect_eq_str(result_to_json(engine.calculate(rot, 17.0)), j0, "Permutation: rotated formula identical");
}

void test_amount_normalization() {
  const std::vector<NormalizedEntry> n =
      normalize_formula({by_amount("A", 50.0), by_amount("B", 50.0)}, 20.0);
  expect_near(n.at(0).concentration, 10.0, 1e-12, "Normalize: 50/50 at 20% gives 10% (A)");
  expect_near(n.at(1).concentration, 10.0, 1e-12, "Normalize: 50/50 at 20% gives 10% (B)");

  const std::vector<NormalizedEntry> z = normalize_formula({by_amount("A", 0.0), by_amount("B", 0.0)}, 50.0);
  expect_true(z.at(0).concentration == 0.0 && z.at(1).concentration == 0.0, "Normalize: zero total gives zero");

  const std::vector<NormalizedEntry> p = normalize_formula({by_percent("A", 40.0)}, 25.0);
  expect_near(p.at(0).concentration, 10.0, 1e-12, "Normalize: 40% of concentrate at 25% gives 10%");
}

void test_phototoxicity_exemption() {
  ComplianceEngine engine(make_reference());

  // 10% Bergamot Oil => 0.03% bergapten (ratio 0.3 against 0.1).
  const ComplianceResult plain = engine.calculate({by_percent("Bergamot Oil", 10.0)}, 100.0);
  expect_near(plain.phototoxicity.sum_of_ratios, 0.3, 1e-12, "Exemption: plain bergamot counts toward photo sum");

  FormulaEntry fcf = by_percent("Bergamot Oil FCF", 10.0);
  fcf.sku = std::string("Bergamot Oil");
  const ComplianceResult exempt = engine.calculate({fcf}, 100.0);
  expect_near(exempt.phototoxicity.sum_of_ratios, 0.0, 0.0, "Exemption: FCF bergamot excluded from photo sum");
  expect_true(find_result(exempt, "BRG") == nullptr, "Exemption: no phototoxicity standard row for FCF only");
  const StandardResult* cit = find_result(exempt, "CIT");
  expect_true(cit != nullptr && cit->concentration > 0.0, "Exemption: FCF bucket still counts toward non-photo standard");

  // Mixed bucket: one exempt, one not => not exempt, both contribute.
  FormulaEntry fcf5 = fcf;
  fcf5.quantity = ByConcentration{5.0};
  const ComplianceResult mixed = engine.calculate({by_percent("Bergamot Oil", 5.0), fcf5}, 100.0);
  expect_near(mixed.phototoxicity.sum_of_ratios, 0.3, 1e-12, "Exemption: mixed bucket is not exempt");

  // Two exempt phototoxic materials together at 2% against a 1% limit.
  ReferenceTables t;
  t.standards["P"] = make_standard("P", "Furocoumarins", StandardType::kPhototoxicity, 1.0);
  t.cas_mapping["fc"] = {"P"};
  t.contributions["lime oil"] = make_record("lime oil", "Lime Oil", {{"fc", 100.0}});
  t.contributions["bergamot"] = make_record("bergamot", "Bergamot", {{"fc", 100.0}});
  ComplianceEngine photo(std::make_shared<ReferenceData>(std::move(t)));

  FormulaEntry lime = by_percent("Lime Oil Distilled", 1.0);
  lime.sku = std::string("lime oil");
  FormulaEntry berg = by_percent("Bergamot Terpeneless", 1.0);
  berg.sku = std::string("bergamot");
  const ComplianceResult two = photo.calculate({lime, berg}, 100.0);
  expect_true(two.phototoxicity.pass && two.phototoxicity.sum_of_ratios == 0.0,
              "Exemption: two exempt phototoxic materials pass");
  expect_true(two.is_compliant, "Exemption: formula of exempt materials is compliant");

  lime.name = "Lime Oil";
  const ComplianceResult one = photo.calculate({lime, berg}, 100.0);
  expect_true(!one.phototoxicity.pass, "Exemption: a non-exempt contributor un-exempts the bucket");

  // 0.3 against a configured sum limit of 0.25.
  EngineSettings strict;
  strict.evaluation.phototoxicity_sum_limit = 0.25;
  ComplianceEngine strict_engine(make_reference(), strict);
  const ComplianceResult tight = strict_engine.calculate({by_percent("Bergamot Oil", 10.0)}, 100.0);
  expect_near(tight.phototoxicity.limit, 0.25, 0.0, "Phototoxicity: configured sum limit reported");
  expect_true(!tight.phototoxicity.pass && !tight.is_compliant, "Phototoxicity: sum above configured limit fails");
  expect_near(plain.phototoxicity.limit, 1.0, 0.0, "Phototoxicity: default sum limit reported");

  const std::vector<std::string> tokens = {"FCF", "DISTILLED", "TERPENELESS"};
  expect_true(is_phototoxicity_exempt("bergamot fcf", tokens), "Heuristic: lower-case token matches");
  expect_true(!is_phototoxicity_exempt("Bergamot", tokens), "Heuristic: plain name not exempt");
}

void test_inverse_dosage_property() {
  ComplianceEngine engine(make_reference());
  const std::vector<FormulaEntry> f = {by_amount("Orange Oil", 30.0), by_amount("Bergamot Oil", 10.0)};

  const ComplianceResult at100 = engine.calculate(f, 100.0);
  expect_true(!at100.is_compliant, "Inverse dosage: formula fails at 100%");
  expect_true(at100.critical_component.has_value(), "Inverse dosage: critical component present");

  const ComplianceResult at_safe = engine.calculate(f, at100.max_safe_dosage);
  expect_near(at_safe.max_ratio, 1.0, 1e-9, "Inverse dosage: max ratio is 1 at max safe dosage");
  expect_true(at_safe.is_compliant, "Inverse dosage: compliant at max safe dosage");
  expect_true(at_safe.critical_component == at100.critical_component,
              "Inverse dosage: same critical component");
}

void test_unresolved_materials() {
  ComplianceEngine engine(make_reference());

  const ComplianceResult base = engine.calculate({by_percent("Orange Oil", 1.0)}, 100.0);
  const ComplianceResult with = engine.calculate(
      {by_percent("Mystery Base", 3.0), by_percent("Orange Oil", 1.0)}, 100.0);

  expect_true(with.unresolved_materials.size() == 1 && with.unresolved_materials[0] == "Mystery Base",
              "Unresolved: listed once by name");
  expect_true(base.results.size() == with.results.size(), "Unresolved: no extra standards");
  for (size_t i = 0; i < base.results.size() && i < with.results.size(); ++i) {
    expect_true(base.results[i].concentration == with.results[i].concentration,
                "Unresolved: contributes nothing to " + base.results[i].standard_id);
  }
}

void test_direct_standard_scenario() {
  ComplianceEngine engine(make_reference());
  const ComplianceResult r = engine.calculate({by_amount("X", 100.0)}, 100.0);

  const StandardResult* x = find_result(r, "XS");
  expect_true(x != nullptr, "Scenario X: standard present");
  if (!x) return;
  expect_near(x->concentration, 100.0, 1e-12, "Scenario X: concentration 100");
  expect_near(x->ratio, 5.0, 1e-12, "Scenario X: ratio 5");
  expect_true(!x->pass, "Scenario X: fails");
  expect_near(x->exceedance_pct, 400.0, 1e-9, "Scenario X: exceedance 400%");
  expect_near(r.max_safe_dosage, 20.0, 1e-12, "Scenario X: max safe dosage 20");
  expect_true(r.critical_component && *r.critical_component == "X Standard", "Scenario X: critical component");
  expect_true(!r.is_compliant, "Scenario X: not compliant");
}

void test_specification_and_clean_formula() {
  ComplianceEngine engine(make_reference());
  const ComplianceResult r = engine.calculate({by_percent("Citrus Accord", 0.1)}, 100.0);

  const StandardResult* spc = find_result(r, "SPC");
  expect_true(spc != nullptr && spc->pass && spc->ratio == 0.0 && !spc->limit,
              "Specification: passes with ratio 0 and no limit");

  const ComplianceResult empty = engine.calculate({}, 50.0);
  expect_true(empty.is_compliant && !empty.critical_component, "Empty formula: compliant, no critical component");
  expect_near(empty.max_safe_dosage, 100.0, 0.0, "Empty formula: fully safe dosage");

  expect_true(limit_ratio(0.0, 0.0) == 0.0, "Ratio: zero concentration over zero limit is 0");
  expect_true(std::isinf(limit_ratio(1.0, 0.0)), "Ratio: positive concentration over zero limit is infinite");
}

void test_integrity_warnings() {
  ComplianceEngine engine(make_reference());
  const ComplianceResult r = engine.calculate({by_percent("Thin Base", 1.0)}, 100.0);
  expect_true(r.data_integrity_warnings.size() == 1 &&
                  r.data_integrity_warnings[0] == "Thin Base (Composition only totals 10.0%)",
              "Integrity: under-documented composition warned");

  FormulaEntry dil = by_percent("Thin Base 10% in DPG", 1.0);
  dil.sku = std::string("thin base");
  const ComplianceResult d = engine.calculate({dil}, 100.0);
  expect_true(d.data_integrity_warnings.empty(), "Integrity: declared dilution not warned");
}

// "oil" is both a regulated key and a decomposable material.
void test_double_resolution() {
  ReferenceTables t;
  t.standards["S"] = make_standard("S", "Oil Standard", StandardType::kRestriction, 100.0);
  t.standards["C"] = make_standard("C", "Chem Standard", StandardType::kRestriction, 100.0);
  t.cas_mapping["oil"] = {"S"};
  t.cas_mapping["chem"] = {"C"};
  t.contributions["oil"] = make_record("oil", "Oil", {{"chem", 50.0}});
  t.contributions["acc"] = make_record("acc", "Accord", {{"oil", 40.0}});
  const auto data = std::make_shared<ReferenceData>(std::move(t));

  const ConstituentKind k = classify_constituent(*data, "oil");
  expect_true(k.mapped_standard && k.decomposable, "Double resolution: oil is mapped and decomposable");

  const ContributionResolver resolver(*data, 10);
  const Resolution r = resolver.resolve("acc", 10.0);
  expect_near(r.contributions.at("oil"), 4.0, 1e-12, "Double resolution: nested oil recorded under its own key");
  expect_near(r.contributions.at("chem"), 2.0, 1e-12, "Double resolution: nested oil also expanded");

  ComplianceEngine engine(data);
  const ComplianceResult via_accord = engine.calculate({by_percent("acc", 10.0)}, 100.0);
  const StandardResult* s1 = find_result(via_accord, "S");
  const StandardResult* c1 = find_result(via_accord, "C");
  expect_true(s1 && std::fabs(s1->concentration - 4.0) < 1e-12, "Double resolution: accord at 10% gives S = 4");
  expect_true(c1 && std::fabs(c1->concentration - 2.0) < 1e-12, "Double resolution: accord at 10% gives C = 2");

  const ComplianceResult direct = engine.calculate({by_percent("oil", 10.0)}, 100.0);
  const StandardResult* s2 = find_result(direct, "S");
  const StandardResult* c2 = find_result(direct, "C");
  expect_true(s2 && std::fabs(s2->concentration - 10.0) < 1e-12, "Double resolution: oil entry added directly (S = 10)");
  expect_true(c2 && std::fabs(c2->concentration - 5.0) < 1e-12, "Double resolution: oil entry also resolved (C = 5)");
}

void test_ledger_rejects_non_finite() {
  ComponentLedger ledger;
  bool threw = false;
  try {
    ledger.add("5989-27-5", std::nan(""), "Broken", false);
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kInvariant;
  }
  expect_true(threw, "Ledger: non-finite concentration is an invariant violation");
  expect_true(ledger.buckets().empty(), "Ledger: rejected add leaves no bucket");
}

void test_invalid_input_errors() {
  ComplianceEngine engine(make_reference());

  bool threw = false;
  try {
    (void)engine.calculate({by_amount("Good", 1.0), by_amount("Bad Oil", std::nan(""))}, 100.0);
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kInvalidNumeric && e.message().find("Bad Oil") != std::string::npos;
  }
  expect_true(threw, "Invalid numeric: NaN amount raises kInvalidNumeric naming the entry");

  threw = false;
  try {
    (void)engine.calculate({by_percent("Neg", -1.0)}, 100.0);
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kInvalidNumeric;
  }
  expect_true(threw, "Invalid numeric: negative percentage rejected");

  threw = false;
  try {
    (void)engine.calculate({by_percent("A", 1.0)}, 0.0);
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kInvalidArgument;
  }
  expect_true(threw, "Invalid argument: zero dosage rejected");

  threw = false;
  try {
    ComplianceEngine bad(nullptr);
  } catch (const Error& e) {
    threw = e.code() == ErrorCode::kInvalidArgument;
  }
  expect_true(threw, "Invalid argument: null reference data rejected");
}

}  // namespace
}  // namespace ifra

int main() {
  using namespace ifra;

  set_log_level(LogLevel::ERROR);

  test_resolution_multiplies_percentages();
  test_cycle_terminates_with_truncation();
  test_permutation_invariance();
  test_amount_normalization();
  test_phototoxicity_exemption();
  test_inverse_dosage_property();
  test_unresolved_materials();
  test_direct_standard_scenario();
  test_specification_and_clean_formula();
  test_integrity_warnings();
  test_double_resolution();
  test_ledger_rejects_non_finite();
  test_invalid_input_errors();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
