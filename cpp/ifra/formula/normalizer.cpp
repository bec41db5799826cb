#include "ifra/formula/formula.hpp"

#include <algorithm>
#include <sstream>

#include "ifra/core/error.hpp"
#include "ifra/core/numeric.hpp"

namespace ifra {

namespace {

std::string describe(const FormulaEntry& e, size_t index) {
  std::ostringstream ss;
  ss << "formula entry #" << index << " '" << e.name << "'";
  return ss.str();
}

} // namespace

void validate_finished_dosage(double finished_dosage) {
  IFRA_ENSURE(is_finite(finished_dosage) && finished_dosage > 0.0 && finished_dosage <= 100.0,
              ErrorCode::kInvalidArgument, "finished_dosage must be in (0,100]");
}

void validate_entry(const FormulaEntry& e, size_t index) {
  if (const auto* a = std::get_if<ByAmount>(&e.quantity)) {
    IFRA_ENSURE(is_finite_nonneg(a->amount), ErrorCode::kInvalidNumeric,
                describe(e, index) + ": amount must be a finite non-negative number");
  } else if (const auto* c = std::get_if<ByConcentration>(&e.quantity)) {
    IFRA_ENSURE(is_finite_nonneg(c->percent), ErrorCode::kInvalidNumeric,
                describe(e, index) + ": concentration must be a finite non-negative number");
  }
}

std::vector<NormalizedEntry> normalize_formula(const std::vector<FormulaEntry>& formula,
                                               double finished_dosage) {
  validate_finished_dosage(finished_dosage);

  // Amounts are summed in sorted order so the total does not depend on entry order.
  std::vector<double> amounts;
  for (size_t i = 0; i < formula.size(); ++i) {
    validate_entry(formula[i], i);
    if (const auto* a = std::get_if<ByAmount>(&formula[i].quantity)) amounts.push_back(a->amount);
  }
  std::sort(amounts.begin(), amounts.end());
  double total_amount = 0.0;
  for (double a : amounts) total_amount += a;

  const double scale = finished_dosage / 100.0;

  std::vector<NormalizedEntry> out;
  out.reserve(formula.size());
  for (size_t i = 0; i < formula.size(); ++i) {
    const FormulaEntry& e = formula[i];

    NormalizedEntry n;
    n.index = i;
    n.name = e.name;
    n.cas = e.cas;
    n.sku = e.sku;

    if (const auto* a = std::get_if<ByAmount>(&e.quantity)) {
      n.concentration = (total_amount > 0.0) ? (a->amount / total_amount * 100.0) * scale : 0.0;
    } else {
      n.concentration = std::get<ByConcentration>(e.quantity).percent * scale;
    }
    out.push_back(std::move(n));
  }
  return out;
}

} // namespace ifra
