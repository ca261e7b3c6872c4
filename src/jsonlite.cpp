#include "helios/jsonlite.hpp"

// DETERMINISM RISKS:
//   std::stod() is locale-sensitive. It is used only for input parsing; output
//   always goes through format_double().

#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace helios::jsonlite {

namespace {

void append_utf8(std::string& o, unsigned cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;
  int depth{0};

  static constexpr int kMaxDepth = 64;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool read_hex4(unsigned& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(s[i + k]);
      if (h < 0) return false;
      out = (out << 4) | static_cast<unsigned>(h);
    }
    i += 4;
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { err = JsonError{"json_parse_error", "expected string"}; return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c != '\\') {
        o += c;
        continue;
      }
      if (i >= s.size()) break;
      switch (const char n = s[i++]) {
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          unsigned cp = 0;
          if (!read_hex4(cp)) { err = JsonError{"json_parse_error", "invalid \\u escape"}; return {}; }
          // Surrogate pair: high half, then the escaped low half.
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            unsigned lo = 0;
            if (!read_hex4(lo)) { err = JsonError{"json_parse_error", "invalid \\u escape"}; return {}; }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default: o += n; break;
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool is_real = false;
    if (i < s.size() && s[i] == '.') {
      is_real = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      is_real = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num = s.substr(start, i - start);
    try {
      if (is_real || num[0] == '-') {
        out_val = Value{std::stod(num)};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num))};
      }
      return true;
    } catch (const std::exception&) {
      err = JsonError{"json_parse_error", "number out of range"};
      return false;
    }
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) { err = JsonError{"json_parse_error", "nesting too deep"}; return {}; }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) return num_val;
    if (!err) err = JsonError{"json_parse_error", "unexpected token"};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.count(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }
};

// Fast path: most keys and ids contain nothing that needs escaping.
std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    }
    else                 o += c;
  }
  return o;
}

void write_value(std::string& out, const Value& v);

void write_object(std::string& out, const Object& obj) {
  out += '{';
  bool first = true;
  for (const auto& [k, vv] : obj) {
    if (!first) out += ',';
    first = false;
    out += '"';
    out += escape_inner(k);
    out += "\":";
    write_value(out, vv);
  }
  out += '}';
}

}  // namespace

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

namespace {

void write_value(std::string& out, const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) {
    out += "null";
  } else if (const auto* b = std::get_if<bool>(&v.v)) {
    out += *b ? "true" : "false";
  } else if (const auto* str = std::get_if<std::string>(&v.v)) {
    out += '"';
    out += escape_inner(*str);
    out += '"';
  } else if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    out += std::to_string(*u);
  } else if (const auto* d = std::get_if<double>(&v.v)) {
    out += format_double(*d);
  } else if (const auto* o = std::get_if<Object>(&v.v)) {
    write_object(out, *o);
  } else {
    out += '[';
    bool first = true;
    for (const auto& item : std::get<Array>(v.v)) {
      if (!first) out += ',';
      first = false;
      write_value(out, item);
    }
    out += ']';
  }
}

}  // namespace

std::string to_json(const Value& v) {
  std::string out;
  write_value(out, v);
  return out;
}

std::string to_json(const Object& obj) {
  std::string out;
  write_object(out, obj);
  return out;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

std::optional<JsonError> validate_strict(const std::string& text) {
  std::optional<JsonError> err;
  (void)parse_value(text, &err);
  return err;
}

Object parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  if (!err && !std::holds_alternative<Object>(v.v)) {
    err = JsonError{"json_parse_error", "root is not an object"};
  }
  if (error) *error = err;
  if (err) return {};
  return std::get<Object>(v.v);
}

std::string escape(const std::string& s) { return escape_inner(s); }

namespace {

// Typed member lookup: nullptr when the key is absent or holds another type.
template <typename T>
const T* find_as(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : std::get_if<T>(&it->second.v);
}

// Numbers without a fraction parse as uint64; accept both where a double is wanted.
bool as_number(const Value& v, double& out) {
  if (const auto* d = std::get_if<double>(&v.v)) {
    out = *d;
    return true;
  }
  if (const auto* u = std::get_if<std::uint64_t>(&v.v)) {
    out = static_cast<double>(*u);
    return true;
  }
  return false;
}

}  // namespace

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  const auto* v = find_as<std::string>(obj, key);
  return v ? *v : def;
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  const auto* v = find_as<bool>(obj, key);
  return v ? *v : def;
}

unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def) {
  const auto* v = find_as<std::uint64_t>(obj, key);
  return v ? *v : def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  double out = def;
  if (it != obj.end() && as_number(it->second, out)) return out;
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  if (const auto* arr = find_as<Array>(obj, key)) {
    for (const auto& item : *arr) {
      if (const auto* str = std::get_if<std::string>(&item.v)) out.push_back(*str);
    }
  }
  return out;
}

std::vector<double> get_double_array(const Object& obj, const std::string& key) {
  std::vector<double> out;
  if (const auto* arr = find_as<Array>(obj, key)) {
    out.reserve(arr->size());
    double d = 0.0;
    for (const auto& item : *arr) {
      if (as_number(item, d)) out.push_back(d);
    }
  }
  return out;
}

Object get_object(const Object& obj, const std::string& key) {
  const auto* v = find_as<Object>(obj, key);
  return v ? *v : Object{};
}

Array get_array(const Object& obj, const std::string& key) {
  const auto* v = find_as<Array>(obj, key);
  return v ? *v : Array{};
}

bool has_key(const Object& obj, const std::string& key) {
  return obj.find(key) != obj.end();
}

}  // namespace helios::jsonlite
