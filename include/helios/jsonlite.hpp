#pragma once

// helios/jsonlite.hpp — Minimal strict JSON parser and deterministic writer.
//
// Used for every persisted record (window, history, reservations, cache
// entries, router table), configuration files and API frames.
//
// DETERMINISM:
//   Objects are std::map, so to_json() always emits keys in sorted order.
//   Doubles are written with format_double() (fixed 6 decimals, trailing zeros
//   trimmed), independent of locale.
//
// LIMITS:
//   Non-negative integers parse as uint64; negative integers and numbers with a
//   fraction or exponent parse as double. NaN/Infinity are rejected. Duplicate
//   keys are rejected with "json_duplicate_key".

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace helios::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v;
};

struct JsonError {
  std::string code;
  std::string message;
};

// Parse any JSON value. On failure returns null and fills *error.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON document whose root must be an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

std::string to_json(const Value& v);
std::string to_json(const Object& obj);
std::string format_double(double d);
std::string escape(const std::string& s);

// Typed extractors. Missing key or wrong type returns the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::vector<double> get_double_array(const Object& obj, const std::string& key);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);
bool has_key(const Object& obj, const std::string& key);

}  // namespace helios::jsonlite
