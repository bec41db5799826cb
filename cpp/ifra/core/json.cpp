#include "ifra/core/json.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>

namespace ifra {
namespace {

constexpr int kMaxNesting = 256;

struct Cursor {
  const char* p = nullptr;
  const char* b = nullptr;
  const char* e = nullptr;

  size_t offset() const { return static_cast<size_t>(p - b); }
};

struct Loc {
  int line = 1;
  int col = 1;
};

inline void bump_loc(Loc& loc, char c) {
  if (c == '\n') { loc.line++; loc.col = 1; }
  else { loc.col++; }
}

void set_err(JsonParseError* err, const Cursor& c, const Loc& loc, std::string msg) {
  if (!err) return;
  err->message = std::move(msg);
  err->offset = c.offset();
  err->line = loc.line;
  err->col = loc.col;
}

inline bool eof(const Cursor& c) { return c.p >= c.e; }

inline void advance(Cursor& c, Loc& loc) {
  bump_loc(loc, *c.p);
  ++c.p;
}

void skip_ws(Cursor& c, Loc& loc) {
  while (!eof(c)) {
    const char ch = *c.p;
    if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
      advance(c, loc);
      continue;
    }
    break;
  }
}

bool expect(Cursor& c, Loc& loc, char ch, JsonParseError* err) {
  skip_ws(c, loc);
  if (eof(c) || *c.p != ch) {
    set_err(err, c, loc, std::string("Expected '") + ch + "'");
    return false;
  }
  advance(c, loc);
  return true;
}

bool match_literal(Cursor& c, Loc& loc, const char* lit) {
  const char* q = c.p;
  Loc tmp = loc;
  for (const char* s = lit; *s; ++s) {
    if (q >= c.e || *q != *s) return false;
    bump_loc(tmp, *q);
    ++q;
  }
  c.p = q;
  loc = tmp;
  return true;
}

bool parse_hex4(Cursor& c, Loc& loc, JsonParseError* err, unsigned& out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    if (eof(c)) {
      set_err(err, c, loc, "Unexpected EOF in \\uXXXX escape");
      return false;
    }
    const char ch = *c.p;
    unsigned v = 0;
    if (ch >= '0' && ch <= '9') v = static_cast<unsigned>(ch - '0');
    else if (ch >= 'a' && ch <= 'f') v = 10u + static_cast<unsigned>(ch - 'a');
    else if (ch >= 'A' && ch <= 'F') v = 10u + static_cast<unsigned>(ch - 'A');
    else {
      set_err(err, c, loc, "Invalid hex digit in \\uXXXX escape");
      return false;
    }
    out = (out << 4) | v;
    advance(c, loc);
  }
  return true;
}

// Encode codepoint (0..0x10FFFF) into UTF-8.
void append_utf8(std::string& s, unsigned cp) {
  if (cp <= 0x7F) {
    s.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    s.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
    s.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    s.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    s.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_string(Cursor& c, Loc& loc, JsonParseError* err, std::string& out) {
  skip_ws(c, loc);
  if (eof(c) || *c.p != '"') {
    set_err(err, c, loc, "Expected string");
    return false;
  }

  advance(c, loc);  // opening quote
  out.clear();

  while (!eof(c)) {
    const char ch = *c.p;
    if (ch == '"') {
      advance(c, loc);
      return true;
    }
    if (static_cast<unsigned char>(ch) < 0x20) {
      set_err(err, c, loc, "Unescaped control character in string");
      return false;
    }
    if (ch == '\\') {
      advance(c, loc);
      if (eof(c)) {
        set_err(err, c, loc, "Unexpected EOF in string escape");
        return false;
      }
      const char esc = *c.p;
      advance(c, loc);
      switch (esc) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          unsigned u = 0;
          if (!parse_hex4(c, loc, err, u)) return false;

          if (u >= 0xD800 && u <= 0xDBFF) {
            if (eof(c) || *c.p != '\\') {
              set_err(err, c, loc, "High surrogate not followed by low surrogate");
              return false;
            }
            advance(c, loc);
            if (eof(c) || *c.p != 'u') {
              set_err(err, c, loc, "High surrogate not followed by \\u");
              return false;
            }
            advance(c, loc);

            unsigned u2 = 0;
            if (!parse_hex4(c, loc, err, u2)) return false;
            if (u2 < 0xDC00 || u2 > 0xDFFF) {
              set_err(err, c, loc, "Invalid low surrogate");
              return false;
            }
            append_utf8(out, 0x10000u + (((u - 0xD800u) << 10) | (u2 - 0xDC00u)));
          } else if (u >= 0xDC00 && u <= 0xDFFF) {
            set_err(err, c, loc, "Unexpected low surrogate");
            return false;
          } else {
            append_utf8(out, u);
          }
        } break;
        default:
          set_err(err, c, loc, "Invalid escape sequence");
          return false;
      }
      continue;
    }

    out.push_back(ch);
    advance(c, loc);
  }

  set_err(err, c, loc, "Unterminated string");
  return false;
}

bool skip_digits(Cursor& c, Loc& loc) {
  bool any = false;
  while (!eof(c) && std::isdigit(static_cast<unsigned char>(*c.p))) {
    advance(c, loc);
    any = true;
  }
  return any;
}

bool parse_number(Cursor& c, Loc& loc, JsonParseError* err, double& out) {
  skip_ws(c, loc);
  const char* start = c.p;

  // JSON number grammar (no leading '+', no NaN/Inf).
  if (!eof(c) && *c.p == '-') advance(c, loc);

  if (eof(c)) {
    set_err(err, c, loc, "Expected number");
    return false;
  }

  if (*c.p == '0') {
    advance(c, loc);
  } else if (*c.p >= '1' && *c.p <= '9') {
    skip_digits(c, loc);
  } else {
    set_err(err, c, loc, "Invalid number");
    return false;
  }

  if (!eof(c) && *c.p == '.') {
    advance(c, loc);
    if (!skip_digits(c, loc)) {
      set_err(err, c, loc, "Expected digits after '.'");
      return false;
    }
  }

  if (!eof(c) && (*c.p == 'e' || *c.p == 'E')) {
    advance(c, loc);
    if (!eof(c) && (*c.p == '+' || *c.p == '-')) advance(c, loc);
    if (!skip_digits(c, loc)) {
      set_err(err, c, loc, "Expected digits in exponent");
      return false;
    }
  }

  const std::string tmp(start, c.p);
  errno = 0;
  char* endptr = nullptr;
  const double v = std::strtod(tmp.c_str(), &endptr);
  if (endptr == tmp.c_str() || *endptr != '\0') {
    set_err(err, c, loc, "Failed to parse number");
    return false;
  }
  if (errno == ERANGE || !std::isfinite(v)) {
    set_err(err, c, loc, "Number out of range");
    return false;
  }
  out = v;
  return true;
}

bool parse_value(Cursor& c, Loc& loc, JsonParseError* err, JsonValue& out, int depth);

bool parse_array(Cursor& c, Loc& loc, JsonParseError* err, JsonValue& out, int depth) {
  if (!expect(c, loc, '[', err)) return false;
  out.type = JsonType::kArray;
  out.array.clear();

  skip_ws(c, loc);
  if (!eof(c) && *c.p == ']') {
    advance(c, loc);
    return true;
  }

  while (true) {
    JsonValue v;
    if (!parse_value(c, loc, err, v, depth + 1)) return false;
    out.array.emplace_back(std::move(v));

    skip_ws(c, loc);
    if (eof(c)) {
      set_err(err, c, loc, "Unexpected EOF in array");
      return false;
    }
    if (*c.p == ',') {
      advance(c, loc);
      continue;
    }
    if (*c.p == ']') {
      advance(c, loc);
      return true;
    }
    set_err(err, c, loc, "Expected ',' or ']'");
    return false;
  }
}

bool parse_object(Cursor& c, Loc& loc, JsonParseError* err, JsonValue& out, int depth) {
  if (!expect(c, loc, '{', err)) return false;
  out.type = JsonType::kObject;
  out.object.clear();

  skip_ws(c, loc);
  if (!eof(c) && *c.p == '}') {
    advance(c, loc);
    return true;
  }

  while (true) {
    std::string key;
    if (!parse_string(c, loc, err, key)) return false;
    if (!expect(c, loc, ':', err)) return false;

    JsonValue val;
    if (!parse_value(c, loc, err, val, depth + 1)) return false;

    out.object[std::move(key)] = std::move(val);

    skip_ws(c, loc);
    if (eof(c)) {
      set_err(err, c, loc, "Unexpected EOF in object");
      return false;
    }
    if (*c.p == ',') {
      advance(c, loc);
      continue;
    }
    if (*c.p == '}') {
      advance(c, loc);
      return true;
    }
    set_err(err, c, loc, "Expected ',' or '}'");
    return false;
  }
}

bool parse_value(Cursor& c, Loc& loc, JsonParseError* err, JsonValue& out, int depth) {
  skip_ws(c, loc);
  if (eof(c)) {
    set_err(err, c, loc, "Unexpected EOF");
    return false;
  }
  if (depth > kMaxNesting) {
    set_err(err, c, loc, "Nesting too deep");
    return false;
  }

  out.line = loc.line;
  out.col = loc.col;

  const char ch = *c.p;
  if (ch == '{') return parse_object(c, loc, err, out, depth);
  if (ch == '[') return parse_array(c, loc, err, out, depth);
  if (ch == '"') {
    out.type = JsonType::kString;
    return parse_string(c, loc, err, out.str);
  }
  if (ch == 't' || ch == 'f') {
    const bool v = (ch == 't');
    if (!match_literal(c, loc, v ? "true" : "false")) {
      set_err(err, c, loc, "Invalid literal");
      return false;
    }
    out.type = JsonType::kBool;
    out.boolean = v;
    return true;
  }
  if (ch == 'n') {
    if (!match_literal(c, loc, "null")) {
      set_err(err, c, loc, "Invalid literal");
      return false;
    }
    out.type = JsonType::kNull;
    return true;
  }
  if (ch == '-' || (ch >= '0' && ch <= '9')) {
    out.type = JsonType::kNumber;
    return parse_number(c, loc, err, out.number);
  }

  set_err(err, c, loc, "Unexpected token");
  return false;
}

}  // namespace

const char* to_string(JsonType t) noexcept {
  switch (t) {
    case JsonType::kNull:   return "null";
    case JsonType::kBool:   return "bool";
    case JsonType::kNumber: return "number";
    case JsonType::kString: return "string";
    case JsonType::kObject: return "object";
    case JsonType::kArray:  return "array";
    default:                return "unknown";
  }
}

const JsonValue* JsonValue::find(std::string_view key) const {
  if (type != JsonType::kObject) return nullptr;
  const auto it = object.find(std::string(key));
  return (it == object.end()) ? nullptr : &it->second;
}

bool parse_json(std::string_view text, JsonValue* out, JsonParseError* err) {
  if (!out) return false;

  Cursor c;
  c.b = text.data();
  c.p = text.data();
  c.e = text.data() + text.size();
  Loc loc;

  JsonValue root;
  if (!parse_value(c, loc, err, root, 0)) return false;

  skip_ws(c, loc);
  if (!eof(c)) {
    set_err(err, c, loc, "Trailing characters after JSON");
    return false;
  }

  *out = std::move(root);
  return true;
}

void set_schema_error(JsonParseError* err, const JsonValue& at, std::string message) {
  if (!err) return;
  err->message = std::move(message);
  err->offset = 0;
  err->line = at.line;
  err->col = at.col;
}

}  // namespace ifra
