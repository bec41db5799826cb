#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ifra {

struct JsonParseError {
  std::string message;
  size_t offset = 0;  // byte offset in input
  int line = 1;       // 1-based
  int col = 1;        // 1-based
};

enum class JsonType { kNull, kBool, kNumber, kString, kObject, kArray };

const char* to_string(JsonType t) noexcept;

/// Parsed JSON document node. Every node remembers where it started so that
/// schema errors found after parsing still point at the offending text.
struct JsonValue {
  JsonType type = JsonType::kNull;
  bool boolean = false;
  double number = 0.0;
  std::string str;
  std::map<std::string, JsonValue> object;  // duplicate keys: last wins
  std::vector<JsonValue> array;

  int line = 1;
  int col = 1;

  bool is_null() const noexcept { return type == JsonType::kNull; }
  bool is_object() const noexcept { return type == JsonType::kObject; }
  bool is_array() const noexcept { return type == JsonType::kArray; }
  bool is_string() const noexcept { return type == JsonType::kString; }
  bool is_number() const noexcept { return type == JsonType::kNumber; }

  // Member lookup; nullptr if this is not an object or the key is absent.
  const JsonValue* find(std::string_view key) const;
};

/// Strict RFC 8259 reader.
/// - Rejects NaN/Inf literals, trailing characters and unescaped control chars.
/// - Nesting deeper than 256 levels is rejected.
bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err = nullptr);

/// Fill `err` with a schema error located at `at`.
void set_schema_error(JsonParseError* err, const JsonValue& at, std::string message);

}  // namespace ifra
