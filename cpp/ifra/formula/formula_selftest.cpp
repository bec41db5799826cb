/*
  Formula Selftest

  Objective
  ---------
  Framework-free selftest for formula input:
    1) Amount and concentration entries normalize to finished-product %.
    2) Invalid numbers and dosages raise typed errors naming the entry.
    3) CSV column heuristics, quoting, BOM and blank-line handling.
    4) Non-numeric CSV cells raise Error(kInvalidNumeric) naming line and material.

  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>

#include "ifra/core/error.hpp"
#include "ifra/formula/formula.hpp"
#include "ifra/formula/formula_csv.hpp"

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

template <class Fn>
bool throws_code(Fn&& fn, ErrorCode code, std::string_view needle = {}) {
  try {
    fn();
  } catch (const Error& e) {
    return e.code() == code && (needle.empty() || e.message().find(needle) != std::string::npos);
  }
  return false;
}

FormulaEntry entry(const std::string& name, Quantity q) {
  FormulaEntry e;
  e.name = name;
  e.quantity = q;
  return e;
}

double amount_of(const FormulaEntry& e) {
  const auto* a = std::get_if<ByAmount>(&e.quantity);
  return a ? a->amount : -1.0;
}

double percent_of(const FormulaEntry& e) {
  const auto* c = std::get_if<ByConcentration>(&e.quantity);
  return c ? c->percent : -1.0;
}

void test_normalize_mixed() {
  const auto n = normalize_formula({entry("A", ByAmount{30.0}),
                                    entry("B", ByConcentration{10.0}),
                                    entry("C", ByAmount{10.0})},
                                   50.0);
  expect_true(n.size() == 3, "Normalize: one output per entry");
  expect_near(n[0].concentration, 37.5, 1e-12, "Normalize: 30 of 40 parts at 50% is 37.5%");
  expect_near(n[1].concentration, 5.0, 1e-12, "Normalize: 10% of concentrate at 50% is 5%");
  expect_near(n[2].concentration, 12.5, 1e-12, "Normalize: 10 of 40 parts at 50% is 12.5%");
  expect_true(n[0].index == 0 && n[2].index == 2 && n[1].name == "B", "Normalize: input order and index kept");
}

void test_normalize_errors() {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();

  expect_true(throws_code([&] { (void)normalize_formula({entry("Musk", ByAmount{nan})}, 100.0); },
                          ErrorCode::kInvalidNumeric, "'Musk'"),
              "Normalize: NaN amount names the entry");
  expect_true(throws_code([&] { (void)normalize_formula({entry("Amber", ByConcentration{inf})}, 100.0); },
                          ErrorCode::kInvalidNumeric, "'Amber'"),
              "Normalize: infinite concentration names the entry");
  expect_true(throws_code([&] { (void)normalize_formula({entry("Oud", ByAmount{-2.0})}, 100.0); },
                          ErrorCode::kInvalidNumeric),
              "Normalize: negative amount rejected");

  expect_true(throws_code([] { validate_finished_dosage(0.0); }, ErrorCode::kInvalidArgument),
              "Dosage: zero rejected");
  expect_true(throws_code([] { validate_finished_dosage(100.5); }, ErrorCode::kInvalidArgument),
              "Dosage: above 100 rejected");
  expect_true(!throws_code([] { validate_finished_dosage(100.0); }, ErrorCode::kInvalidArgument),
              "Dosage: 100 accepted");
}

void test_detect_columns() {
  const FormulaCsvColumns a = detect_formula_columns({"Material Name", "CAS No", "Weight (g)"});
  expect_true(a.name == 0 && a.cas == 1 && a.amount == 2 && a.concentration < 0,
              "Columns: name, cas and weight detected");

  const FormulaCsvColumns b = detect_formula_columns({"SKU", "Ingredient", "Conc %"});
  expect_true(b.name == 0 && b.concentration == 2 && b.amount < 0 && b.sku < 0,
              "Columns: name falls back to column 0");

  const FormulaCsvColumns c = detect_formula_columns({"Ingredient", "Qty"});
  expect_true(c.name == 0 && c.amount == 1, "Columns: column 1 is the amount fallback");

  expect_true(throws_code([] { (void)detect_formula_columns({"Ingredient"}); }, ErrorCode::kParseError),
              "Columns: single column without quantity rejected");
}

void test_split_csv() {
  const auto rows = split_csv("a,\"b,c\",\"say \"\"hi\"\"\"\r\nd,,e\n");
  expect_true(rows.size() == 2, "CSV: two records");
  if (rows.size() == 2) {
    expect_true(rows[0].size() == 3 && rows[0][1] == "b,c" && rows[0][2] == "say \"hi\"",
                "CSV: quoted comma and doubled quotes");
    expect_true(rows[1].size() == 3 && rows[1][1].empty(), "CSV: empty middle cell");
  }

  std::vector<size_t> lines;
  const auto multi = split_csv("h1,h2\n\"two\nlines\",x\nlast,y\n", &lines);
  expect_true(multi.size() == 3 && lines.size() == 3 && lines[0] == 1 && lines[1] == 2 && lines[2] == 4,
              "CSV: record start lines follow physical lines");
}

void test_parse_formula_csv() {
  const std::string text =
      "\xEF\xBB\xBF" "Name,CAS,Amount,Concentration\n"
      "Linalool,78-70-6,12.5,\n"
      "\n"
      "\"Bergamot, FCF\",,,3%\n"
      ",,1,\n";
  const auto f = parse_formula_csv(text);
  expect_true(f.size() == 3, "Formula CSV: blank row skipped");
  if (f.size() == 3) {
    expect_true(f[0].name == "Linalool" && f[0].cas && *f[0].cas == "78-70-6" && amount_of(f[0]) == 12.5,
                "Formula CSV: amount row with CAS");
    expect_true(f[1].name == "Bergamot, FCF" && !f[1].cas && percent_of(f[1]) == 3.0,
                "Formula CSV: concentration row with trailing %");
    expect_true(f[2].name == "Unknown" && amount_of(f[2]) == 1.0, "Formula CSV: empty name becomes Unknown");
  }

  expect_true(throws_code([] { (void)parse_formula_csv("Name,Amount\nRose,12g\n"); },
                          ErrorCode::kInvalidNumeric, "line 2 'Rose'"),
              "Formula CSV: bad amount names line and material");
  expect_true(throws_code([] { (void)parse_formula_csv("Name,Amount\n\"Rose\nAbsolute\",1\n\nJasmine,x\n"); },
                          ErrorCode::kInvalidNumeric, "line 5 'Jasmine'"),
              "Formula CSV: error line counts newlines inside quoted cells");
  expect_true(throws_code([] { (void)parse_formula_csv("Name,Amount\nRose,-1\n"); },
                          ErrorCode::kInvalidNumeric),
              "Formula CSV: negative amount rejected");
  expect_true(throws_code([] { (void)parse_formula_csv(""); }, ErrorCode::kParseError),
              "Formula CSV: empty input rejected");
  expect_true(throws_code([] { (void)load_formula_csv("/nonexistent/ifra/formula.csv"); }, ErrorCode::kIoError),
              "Formula CSV: missing file raises kIoError");
}

}  // namespace
}  // namespace ifra

int main() {
  using namespace ifra;

  test_normalize_mixed();
  test_normalize_errors();
  test_detect_columns();
  test_split_csv();
  test_parse_formula_csv();

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
