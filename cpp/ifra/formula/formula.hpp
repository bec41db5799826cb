#pragma once
/*
===============================================================================
Formula: entries and finished-product normalization
File: cpp/ifra/formula/formula.hpp
===============================================================================

A formula entry is given either as a mass/parts amount (relative to the rest
of the formula) or directly as a percentage of the concentrate. Normalization
turns both into a concentration in the finished product:

  amount entry:        (amount / total_amount * 100) * (finished_dosage / 100)
  concentration entry:  percent * (finished_dosage / 100)

A zero total amount yields concentration 0 for every amount entry.
===============================================================================
*/

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ifra {

struct ByAmount {
  double amount = 0.0;  // grams / parts, >= 0
};

struct ByConcentration {
  double percent = 0.0;  // % of concentrate, >= 0
};

using Quantity = std::variant<ByAmount, ByConcentration>;

struct FormulaEntry {
  std::string name;
  std::optional<std::string> cas;
  std::optional<std::string> sku;
  Quantity quantity = ByAmount{};
};

struct NormalizedEntry {
  size_t index = 0;  // position in the caller's formula
  std::string name;
  std::optional<std::string> cas;
  std::optional<std::string> sku;
  double concentration = 0.0;  // % of finished product
};

/// Throws Error(kInvalidArgument) unless 0 < finished_dosage <= 100.
void validate_finished_dosage(double finished_dosage);

/// Throws Error(kInvalidNumeric) naming the entry if its amount or percentage
/// is not a finite non-negative number.
void validate_entry(const FormulaEntry& e, size_t index);

/// Validate every entry and convert to finished-product concentrations.
/// Output order matches input order.
std::vector<NormalizedEntry> normalize_formula(const std::vector<FormulaEntry>& formula,
                                               double finished_dosage);

} // namespace ifra
