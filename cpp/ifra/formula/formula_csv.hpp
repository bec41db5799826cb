#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "ifra/formula/formula.hpp"

namespace ifra {

// Column indices resolved from a header row; -1 = absent.
struct FormulaCsvColumns {
  int name = -1;
  int amount = -1;
  int concentration = -1;
  int cas = -1;
  int sku = -1;
};

/// Header heuristics (case-insensitive):
///   name          first header containing "name", else column 0
///   amount        first header containing "amount", "weight", "mass" or "gram"
///   concentration first header containing "conc", "percent" or "%"
///   cas / sku     header containing "cas" / "sku"
/// With neither amount nor concentration matched, column 1 is the amount.
/// Throws Error(kParseError) if no quantity column can be identified.
FormulaCsvColumns detect_formula_columns(const std::vector<std::string>& header);

/// Split CSV text into records (RFC 4180 quoting, CRLF or LF line ends).
/// If `record_lines` is given it receives the 1-based physical line on which
/// each record starts (quoted cells may span lines).
std::vector<std::vector<std::string>> split_csv(std::string_view text,
                                                std::vector<size_t>* record_lines = nullptr);

/// Parse a formula from CSV text with a header row. Blank rows are skipped.
/// Throws Error(kInvalidNumeric) naming the line and material when a
/// quantity cell is not a number.
std::vector<FormulaEntry> parse_formula_csv(std::string_view text);

/// File convenience. Throws Error(kIoError) when the file cannot be read.
std::vector<FormulaEntry> load_formula_csv(const std::string& path);

} // namespace ifra
