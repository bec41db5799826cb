/*
  IFRA Compliance CLI

  Objective
  ---------
  Command-line front end for CI and batch checks:
    1) Loads the standards / CAS mapping and contributions JSON files
    2) Loads a formula CSV and evaluates it at a finished-product dosage
    3) Prints the text report; optionally writes JSON and CSV results
    4) Returns deterministic exit codes for gating

  Exit codes (check)
  ------------------
    0  => compliant
    2  => at least one standard (or the phototoxicity sum) fails
    3  => compliant, but unresolved materials or truncated compositions exist
    1  => tool error (invalid args / parse error / io error / invalid numeric)

  Usage
  -----
  ifra_cli check --standards <path> --contributions <path> --formula <path.csv>
                 --dosage <pct> [--json <path|->] [--csv <path|->]
                 [--config <path>] [--log-level <level>]

  ifra_cli search --contributions <path> --query <text>
                  [--standards <path>] [--limit <n>] [--log-level <level>]
*/

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "ifra/compliance/compliance_engine.hpp"
#include "ifra/core/error.hpp"
#include "ifra/core/logging.hpp"
#include "ifra/core/settings.hpp"
#include "ifra/formula/formula_csv.hpp"
#include "ifra/refdata/material_search.hpp"
#include "ifra/refdata/refdata_json.hpp"
#include "ifra/report/result_csv.hpp"
#include "ifra/report/result_json.hpp"
#include "ifra/report/text_report.hpp"

namespace ifra {
namespace {

enum class ExitCode : int {
  kCompliant = 0,
  kError = 1,
  kNonCompliant = 2,
  kIncomplete = 3,
};

static constexpr int kExitErrorInt = static_cast<int>(ExitCode::kError);

enum class Command { kNone, kCheck, kSearch };

struct Args {
  Command command = Command::kNone;

  std::string standards_path;
  std::string contributions_path;
  std::string formula_path;
  std::string json_path;
  std::string csv_path;
  std::string config_path;

  double dosage = 0.0;
  bool dosage_set = false;

  std::string query;
  size_t limit = 10;

  LogLevel log_level = LogLevel::WARN;
};

static void print_usage(std::ostream& os) {
  os <<
    "ifra_cli check --standards <path> --contributions <path> --formula <path.csv>\n"
    "               --dosage <pct> [options]\n"
    "ifra_cli search --contributions <path> --query <text> [options]\n"
    "\n"
    "check options:\n"
    "  --json <path|->      write the result as JSON\n"
    "  --csv <path|->       write per-standard rows as CSV\n"
    "  --config <path>      engine settings JSON\n"
    "\n"
    "search options:\n"
    "  --standards <path>   mark materials that map to a standard\n"
    "  --limit <n>          maximum matches shown (default 10)\n"
    "\n"
    "common:\n"
    "  --log-level debug|info|warn|error (default warn)\n";
}

static bool parse_double(const char* s, double* out) {
  if (!s || !out) return false;
  char* end = nullptr;
  const double v = std::strtod(s, &end);
  if (end == s || *end != '\0') return false;
  if (!std::isfinite(v)) return false;
  *out = v;
  return true;
}

static bool parse_size(const char* s, size_t* out) {
  if (!s || !out || *s == '-') return false;
  char* end = nullptr;
  const unsigned long long v = std::strtoull(s, &end, 10);
  if (end == s || *end != '\0') return false;
  *out = static_cast<size_t>(v);
  return true;
}

static bool get_next(int& i, int argc, char** argv, const char** out) {
  if (i + 1 >= argc) return false;
  *out = argv[++i];
  return true;
}

static bool parse_args(int argc, char** argv, Args* a, std::string* err, bool* help_requested) {
  if (!a) return false;
  if (argc < 2) { if (err) *err = "Missing command"; return false; }

  const char* cmd = argv[1];
  if (std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
    if (help_requested) *help_requested = true;
    return true;
  }
  if (std::strcmp(cmd, "check") == 0) {
    a->command = Command::kCheck;
  } else if (std::strcmp(cmd, "search") == 0) {
    a->command = Command::kSearch;
  } else {
    if (err) *err = std::string("Unknown command: ") + cmd;
    return false;
  }

  for (int i = 2; i < argc; ++i) {
    const char* k = argv[i];
    const char* v = nullptr;

    if (std::strcmp(k, "--help") == 0 || std::strcmp(k, "-h") == 0) {
      if (help_requested) *help_requested = true;
      return true;
    }

    // Every remaining option takes exactly one value.
    if (!get_next(i, argc, argv, &v)) {
      if (err) *err = std::string(k) + " requires a value";
      return false;
    }

    if (std::strcmp(k, "--standards") == 0) {
      a->standards_path = v;
    } else if (std::strcmp(k, "--contributions") == 0) {
      a->contributions_path = v;
    } else if (std::strcmp(k, "--formula") == 0) {
      a->formula_path = v;
    } else if (std::strcmp(k, "--json") == 0) {
      a->json_path = v;
    } else if (std::strcmp(k, "--csv") == 0) {
      a->csv_path = v;
    } else if (std::strcmp(k, "--config") == 0) {
      a->config_path = v;
    } else if (std::strcmp(k, "--query") == 0) {
      a->query = v;
    } else if (std::strcmp(k, "--dosage") == 0) {
      if (!parse_double(v, &a->dosage)) { if (err) *err = "--dosage must be a finite number"; return false; }
      a->dosage_set = true;
    } else if (std::strcmp(k, "--limit") == 0) {
      if (!parse_size(v, &a->limit)) { if (err) *err = "--limit must be a non-negative integer"; return false; }
    } else if (std::strcmp(k, "--log-level") == 0) {
      if (!parse_log_level(v, &a->log_level)) { if (err) *err = "--log-level must be debug|info|warn|error"; return false; }
    } else {
      if (err) *err = std::string("Unknown argument: ") + k;
      return false;
    }
  }

  if (a->contributions_path.empty()) { if (err) *err = "Missing --contributions"; return false; }
  if (a->command == Command::kCheck) {
    if (a->standards_path.empty()) { if (err) *err = "Missing --standards"; return false; }
    if (a->formula_path.empty()) { if (err) *err = "Missing --formula"; return false; }
    if (!a->dosage_set) { if (err) *err = "Missing --dosage"; return false; }
  } else {
    if (a->query.empty()) { if (err) *err = "Missing --query"; return false; }
  }
  return true;
}

static bool write_file(const std::string& path, const std::string& data) {
  std::ofstream f(path, std::ios::binary | std::ios::trunc);
  if (!f.good()) return false;
  f.write(data.data(), static_cast<std::streamsize>(data.size()));
  return f.good();
}

// "-" writes to stdout.
static bool emit(const std::string& path, const std::string& data) {
  if (path == "-") {
    std::cout << data;
    return std::cout.good();
  }
  return write_file(path, data);
}

static int to_exit_code_int(const ComplianceResult& r) {
  if (!r.is_compliant) return static_cast<int>(ExitCode::kNonCompliant);
  if (!r.unresolved_materials.empty() || !r.truncated_materials.empty()) {
    return static_cast<int>(ExitCode::kIncomplete);
  }
  return static_cast<int>(ExitCode::kCompliant);
}

static int run_check(const Args& a) {
  EngineSettings settings{};
  if (!a.config_path.empty()) settings = load_settings_file(a.config_path);

  ComplianceEngine engine(load_reference_data(a.standards_path, a.contributions_path), settings);
  const std::vector<FormulaEntry> formula = load_formula_csv(a.formula_path);

  std::ostringstream ss;
  ss << "checking " << formula.size() << " formula entries at " << a.dosage << "%";
  log(LogLevel::INFO, ss.str());

  const ComplianceResult result = engine.calculate(formula, a.dosage);

  // Keep stdout clean for machine output when JSON or CSV goes there.
  std::ostream& report_os = (a.json_path == "-" || a.csv_path == "-") ? std::cerr : std::cout;
  write_text_report(report_os, result);

  if (!a.json_path.empty()) {
    const bool ok = a.json_path == "-" ? emit(a.json_path, result_to_json(result))
                                       : write_result_json_file(result, a.json_path);
    if (!ok) {
      std::cerr << "IO error: failed to write JSON: " << a.json_path << "\n";
      return kExitErrorInt;
    }
  }
  if (!a.csv_path.empty()) {
    std::ostringstream csv;
    write_result_csv(csv, result);
    if (!emit(a.csv_path, csv.str())) {
      std::cerr << "IO error: failed to write CSV: " << a.csv_path << "\n";
      return kExitErrorInt;
    }
  }

  return to_exit_code_int(result);
}

static int run_search(const Args& a) {
  const auto data = load_reference_data(a.standards_path, a.contributions_path);
  const MaterialSearchResult found = search_materials(*data, a.query, a.limit);

  std::cout << "Found " << found.total << " match(es) for '" << a.query << "'";
  if (found.total > found.matches.size()) std::cout << " (showing " << found.matches.size() << ")";
  std::cout << "\n";
  for (const auto& m : found.matches) {
    std::cout << "  " << m.key << "  " << m.name;
    if (m.regulated) std::cout << "  [regulated]";
    std::cout << "\n";
  }
  return std::cout.good() ? 0 : kExitErrorInt;
}

}  // namespace
}  // namespace ifra

int main(int argc, char** argv) {
  using namespace ifra;

  Args a{};
  std::string arg_err;
  bool help = false;
  if (!parse_args(argc, argv, &a, &arg_err, &help)) {
    if (!arg_err.empty()) {
      std::cerr << "Argument error: " << arg_err << "\n\n";
    }
    print_usage(std::cerr);
    return kExitErrorInt;
  }
  if (help) {
    print_usage(std::cout);
    return 0;
  }

  set_log_level(a.log_level);

  try {
    return a.command == Command::kCheck ? run_check(a) : run_search(a);
  } catch (const Error& e) {
    if (is_input_error(e.code())) {
      std::cerr << to_string(e.code()) << ": " << e.message() << "\n";
    } else {
      std::cerr << e.what() << "\n";
    }
    return kExitErrorInt;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return kExitErrorInt;
  }
}
