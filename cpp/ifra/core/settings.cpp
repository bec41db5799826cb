#include "ifra/core/settings.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

#include "ifra/core/json.hpp"

namespace ifra {

namespace {

std::string where(const JsonValue& v) {
  std::ostringstream ss;
  ss << " @ " << v.line << ":" << v.col;
  return ss.str();
}

const JsonValue* section(const JsonValue& root, const char* name) {
  const JsonValue* s = root.find(name);
  if (!s) return nullptr;
  IFRA_ENSURE(s->is_object(), ErrorCode::kParseError,
              std::string("settings: '") + name + "' must be an object" + where(*s));
  return s;
}

void read_number(const JsonValue* sec, const char* key, double& out) {
  if (!sec) return;
  const JsonValue* v = sec->find(key);
  if (!v) return;
  IFRA_ENSURE(v->is_number(), ErrorCode::kParseError,
              std::string("settings: '") + key + "' must be a number" + where(*v));
  out = v->number;
}

void read_int(const JsonValue* sec, const char* key, int& out) {
  double d = static_cast<double>(out);
  read_number(sec, key, d);
  IFRA_ENSURE(std::floor(d) == d && std::fabs(d) < 1e6, ErrorCode::kParseError,
              std::string("settings: '") + key + "' must be an integer");
  out = static_cast<int>(d);
}

void read_tokens(const JsonValue* sec, const char* key, std::vector<std::string>& out) {
  if (!sec) return;
  const JsonValue* v = sec->find(key);
  if (!v) return;
  IFRA_ENSURE(v->is_array(), ErrorCode::kParseError,
              std::string("settings: '") + key + "' must be an array of strings" + where(*v));
  std::vector<std::string> tokens;
  tokens.reserve(v->array.size());
  for (const auto& t : v->array) {
    IFRA_ENSURE(t.is_string(), ErrorCode::kParseError,
                std::string("settings: '") + key + "' elements must be strings" + where(t));
    tokens.push_back(t.str);
  }
  out = std::move(tokens);
}

} // namespace

EngineSettings settings_from_json(std::string_view json, const EngineSettings& base) {
  JsonValue root;
  JsonParseError perr;
  if (!parse_json(json, &root, &perr)) {
    std::ostringstream ss;
    ss << "settings: " << perr.message << " @ " << perr.line << ":" << perr.col;
    IFRA_THROW(ErrorCode::kParseError, ss.str());
  }
  IFRA_ENSURE(root.is_object(), ErrorCode::kParseError, "settings: root must be an object");

  EngineSettings s = base;

  const JsonValue* res = section(root, "resolution");
  read_int(res, "max_depth", s.resolution.max_depth);

  const JsonValue* ev = section(root, "evaluation");
  read_number(ev, "pass_tolerance", s.evaluation.pass_tolerance);
  read_number(ev, "ratio_floor", s.evaluation.ratio_floor);
  read_number(ev, "phototoxicity_sum_limit", s.evaluation.phototoxicity_sum_limit);
  read_number(ev, "fully_safe_dosage", s.evaluation.fully_safe_dosage);

  const JsonValue* integ = section(root, "integrity");
  read_number(integ, "min_documented_pct", s.integrity.min_documented_pct);
  read_tokens(integ, "dilution_tokens", s.integrity.dilution_tokens);

  const JsonValue* ex = section(root, "exemption");
  read_tokens(ex, "phototoxicity_exempt_tokens", s.exemption.phototoxicity_exempt_tokens);

  s.validate_or_throw();
  return s;
}

EngineSettings load_settings_file(const std::string& path, const EngineSettings& base) {
  std::ifstream f(path, std::ios::binary);
  IFRA_ENSURE(f.good(), ErrorCode::kIoError, "failed to open settings file: " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return settings_from_json(ss.str(), base);
}

} // namespace ifra
