#include "ifra/formula/formula_csv.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <sstream>

#include "ifra/core/error.hpp"
#include "ifra/core/numeric.hpp"
#include "ifra/core/text.hpp"

namespace ifra {

namespace {

int find_header(const std::vector<std::string>& header,
                std::initializer_list<const char*> needles,
                std::initializer_list<int> taken) {
  for (size_t i = 0; i < header.size(); ++i) {
    const int idx = static_cast<int>(i);
    bool used = false;
    for (int t : taken) used = used || (t == idx);
    if (used) continue;
    for (const char* n : needles) {
      if (contains_icase(header[i], n)) return idx;
    }
  }
  return -1;
}

bool is_blank_row(const std::vector<std::string>& row) {
  for (const auto& cell : row) {
    if (!trim(cell).empty()) return false;
  }
  return true;
}

std::string cell_at(const std::vector<std::string>& row, int idx) {
  if (idx < 0 || static_cast<size_t>(idx) >= row.size()) return {};
  return trim(row[static_cast<size_t>(idx)]);
}

// Strict number: whole cell consumed, finite. A trailing '%' is allowed.
bool parse_cell_number(std::string s, double* out) {
  if (!s.empty() && s.back() == '%') s = trim(std::string_view(s).substr(0, s.size() - 1));
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE || !is_finite(v)) return false;
  *out = v;
  return true;
}

[[noreturn]] void throw_bad_cell(size_t line, const std::string& name, const char* what, const std::string& cell) {
  std::ostringstream ss;
  ss << "formula line " << line << " '" << name << "': " << what << " '" << cell << "' is not a number";
  IFRA_THROW(ErrorCode::kInvalidNumeric, ss.str());
}

} // namespace

FormulaCsvColumns detect_formula_columns(const std::vector<std::string>& header) {
  FormulaCsvColumns c;
  IFRA_ENSURE(!header.empty(), ErrorCode::kParseError, "formula CSV: missing header row");

  c.name = find_header(header, {"name"}, {});
  if (c.name < 0) c.name = 0;

  c.amount = find_header(header, {"amount", "weight", "mass", "gram"}, {c.name});
  c.concentration = find_header(header, {"conc", "percent", "%"}, {c.name, c.amount});
  c.cas = find_header(header, {"cas"}, {c.name, c.amount, c.concentration});
  c.sku = find_header(header, {"sku"}, {c.name, c.amount, c.concentration, c.cas});

  if (c.amount < 0 && c.concentration < 0) {
    const int fallback = (c.name == 1) ? 0 : 1;
    IFRA_ENSURE(header.size() > 1 && fallback != c.name, ErrorCode::kParseError,
                "formula CSV: could not identify an amount column; use a header containing "
                "'amount', 'weight' or 'grams'");
    c.amount = fallback;
    if (c.cas == c.amount) c.cas = -1;
    if (c.sku == c.amount) c.sku = -1;
  }
  return c;
}

std::vector<std::vector<std::string>> split_csv(std::string_view text, std::vector<size_t>* record_lines) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string cell;
  bool in_quotes = false;
  bool any = false;
  size_t line = 1;
  size_t row_line = 1;

  auto end_cell = [&]() {
    row.push_back(std::move(cell));
    cell.clear();
  };
  auto end_row = [&]() {
    end_cell();
    rows.push_back(std::move(row));
    row.clear();
    any = false;
    if (record_lines) record_lines->push_back(row_line);
  };

  for (size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_quotes) {
      if (ch == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          cell.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        if (ch == '\n') ++line;
        cell.push_back(ch);
      }
      continue;
    }
    if (ch == '"') { in_quotes = true; any = true; continue; }
    if (ch == ',') { end_cell(); any = true; continue; }
    if (ch == '\r') continue;
    if (ch == '\n') {
      end_row();
      row_line = ++line;
      continue;
    }
    cell.push_back(ch);
    any = true;
  }
  if (any || !cell.empty() || !row.empty()) end_row();
  return rows;
}

std::vector<FormulaEntry> parse_formula_csv(std::string_view text) {
  // Strip a UTF-8 byte-order mark written by spreadsheet exports.
  if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF") text.remove_prefix(3);

  std::vector<size_t> lines;
  const auto rows = split_csv(text, &lines);
  IFRA_ENSURE(!rows.empty(), ErrorCode::kParseError, "formula CSV: empty input");

  const FormulaCsvColumns cols = detect_formula_columns(rows.front());

  std::vector<FormulaEntry> out;
  out.reserve(rows.size() - 1);
  for (size_t r = 1; r < rows.size(); ++r) {
    const auto& row = rows[r];
    if (is_blank_row(row)) continue;
    const size_t line = lines[r];

    FormulaEntry e;
    e.name = cell_at(row, cols.name);
    if (e.name.empty()) e.name = "Unknown";

    const std::string cas = cell_at(row, cols.cas);
    if (!cas.empty()) e.cas = cas;
    const std::string sku = cell_at(row, cols.sku);
    if (!sku.empty()) e.sku = sku;

    const std::string amount = cell_at(row, cols.amount);
    const std::string conc = cell_at(row, cols.concentration);
    double v = 0.0;
    if (!amount.empty()) {
      if (!parse_cell_number(amount, &v)) throw_bad_cell(line, e.name, "amount", amount);
      e.quantity = ByAmount{v};
    } else if (!conc.empty()) {
      if (!parse_cell_number(conc, &v)) throw_bad_cell(line, e.name, "concentration", conc);
      e.quantity = ByConcentration{v};
    } else {
      throw_bad_cell(line, e.name, "amount", amount);
    }

    validate_entry(e, out.size());
    out.push_back(std::move(e));
  }
  return out;
}

std::vector<FormulaEntry> load_formula_csv(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  IFRA_ENSURE(f.good(), ErrorCode::kIoError, "failed to open formula file: " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return parse_formula_csv(ss.str());
}

} // namespace ifra
