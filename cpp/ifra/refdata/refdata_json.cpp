#include "ifra/refdata/refdata_json.hpp"

#include <fstream>
#include <sstream>
#include <utility>

#include "ifra/core/error.hpp"
#include "ifra/core/logging.hpp"

namespace ifra {
namespace {

bool require_type(const JsonValue& v, JsonType t, const std::string& what, JsonParseError* err) {
  if (v.type == t) return true;
  set_schema_error(err, v, what + " must be " + (t == JsonType::kObject ? "an " : "a ") + to_string(t));
  return false;
}

bool parse_standard(const std::string& id, const JsonValue& v, Standard& out, JsonParseError* err) {
  const std::string ctx = "metadata." + id;
  if (!require_type(v, JsonType::kObject, ctx, err)) return false;

  out = Standard{};
  out.id = id;
  out.name = id;

  if (const JsonValue* name = v.find("name")) {
    if (!require_type(*name, JsonType::kString, ctx + ".name", err)) return false;
    if (!name->str.empty()) out.name = name->str;
  }

  const JsonValue* type = v.find("type");
  if (!type) {
    set_schema_error(err, v, ctx + ".type is required");
    return false;
  }
  if (!require_type(*type, JsonType::kString, ctx + ".type", err)) return false;
  out.type = classify_standard_type(type->str);

  if (const JsonValue* lim = v.find("limit_cat4")) {
    if (lim->is_number()) {
      if (lim->number < 0.0) {
        set_schema_error(err, *lim, ctx + ".limit_cat4 must be non-negative");
        return false;
      }
      out.limit_cat4 = lim->number;
    } else if (!lim->is_null()) {
      set_schema_error(err, *lim, ctx + ".limit_cat4 must be number or null");
      return false;
    }
  }
  return true;
}

bool parse_record(const std::string& key, const JsonValue& v, ContributionRecord& out, JsonParseError* err) {
  if (!require_type(v, JsonType::kObject, key, err)) return false;

  out = ContributionRecord{};
  out.key = key;
  out.name = key;

  if (const JsonValue* name = v.find("name")) {
    if (!require_type(*name, JsonType::kString, key + ".name", err)) return false;
    if (!name->str.empty()) out.name = name->str;
  }

  if (const JsonValue* cons = v.find("constituents")) {
    if (!require_type(*cons, JsonType::kObject, key + ".constituents", err)) return false;
    out.constituents.reserve(cons->object.size());
    for (const auto& [ck, cv] : cons->object) {
      const std::string ctx = key + ".constituents." + ck;
      if (!require_type(cv, JsonType::kNumber, ctx, err)) return false;
      if (cv.number < 0.0 || cv.number > 100.0) {
        set_schema_error(err, cv, ctx + " must be within [0,100]");
        return false;
      }
      out.constituents.push_back(Constituent{ck, cv.number});
    }
  }
  return true;
}

std::string read_file_or_throw(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  IFRA_ENSURE(f.good(), ErrorCode::kIoError, "failed to open reference file: " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  IFRA_ENSURE(!f.bad(), ErrorCode::kIoError, "failed to read reference file: " + path);
  return ss.str();
}

[[noreturn]] void throw_parse(const std::string& path, const JsonParseError& perr) {
  std::ostringstream ss;
  ss << path << ": " << perr.message << " @ " << perr.line << ":" << perr.col;
  IFRA_THROW(ErrorCode::kParseError, ss.str());
}

}  // namespace

bool parse_standards_json(std::string_view json, ReferenceTables* out, JsonParseError* err) {
  if (!out) return false;

  JsonValue root;
  if (!parse_json(json, &root, err)) return false;
  if (!require_type(root, JsonType::kObject, "root", err)) return false;

  std::map<std::string, Standard> standards;
  if (const JsonValue* meta = root.find("metadata")) {
    if (!require_type(*meta, JsonType::kObject, "metadata", err)) return false;
    for (const auto& [id, v] : meta->object) {
      Standard s;
      if (!parse_standard(id, v, s, err)) return false;
      standards.emplace(id, std::move(s));
    }
  }

  std::map<std::string, std::vector<std::string>> mapping;
  if (const JsonValue* cm = root.find("cas_mapping")) {
    if (!require_type(*cm, JsonType::kObject, "cas_mapping", err)) return false;
    for (const auto& [cas, ids] : cm->object) {
      if (!require_type(ids, JsonType::kArray, "cas_mapping." + cas, err)) return false;
      std::vector<std::string> list;
      list.reserve(ids.array.size());
      for (const auto& id : ids.array) {
        if (!require_type(id, JsonType::kString, "cas_mapping." + cas + "[]", err)) return false;
        list.push_back(id.str);
      }
      mapping.emplace(cas, std::move(list));
    }
  }

  out->standards = std::move(standards);
  out->cas_mapping = std::move(mapping);
  return true;
}

bool parse_contributions_json(std::string_view json, ReferenceTables* out, JsonParseError* err) {
  if (!out) return false;

  JsonValue root;
  if (!parse_json(json, &root, err)) return false;
  if (!require_type(root, JsonType::kObject, "root", err)) return false;

  std::map<std::string, ContributionRecord> records;
  for (const auto& [key, v] : root.object) {
    ContributionRecord rec;
    if (!parse_record(key, v, rec, err)) return false;
    records.emplace(key, std::move(rec));
  }

  out->contributions = std::move(records);
  return true;
}

std::shared_ptr<const ReferenceData> load_reference_data(const std::string& standards_path,
                                                         const std::string& contributions_path) {
  ReferenceTables tables;
  JsonParseError perr;

  if (!standards_path.empty()) {
    const std::string std_text = read_file_or_throw(standards_path);
    if (!parse_standards_json(std_text, &tables, &perr)) throw_parse(standards_path, perr);
  }

  const std::string contrib_text = read_file_or_throw(contributions_path);
  if (!parse_contributions_json(contrib_text, &tables, &perr)) throw_parse(contributions_path, perr);

  std::shared_ptr<const ReferenceData> data = std::make_shared<ReferenceData>(std::move(tables));

  std::ostringstream ss;
  ss << "reference data loaded: standards=" << data->standards().size()
     << " cas_mapping=" << data->cas_mapping().size()
     << " contributions=" << data->contributions().size()
     << " fingerprint=" << hash_to_hex(data->fingerprint());
  log(LogLevel::INFO, ss.str());
  return data;
}

} // namespace ifra
