#pragma once

// arf/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// Used for configuration, policy files, raw event ingestion and diagnostics
// serialization. Objects are std::map so serialization is key-sorted and
// therefore canonical.
//
// LIMITS:
//   - Numbers: non-negative integers parse as uint64, everything else as double.
//   - NaN/Infinity are rejected.
//   - Duplicate object keys are rejected (json_duplicate_key).

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace arf::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::string, std::uint64_t, double, Object, Array> v;
};

// Parse a JSON document whose root must be an object. Returns an empty object
// and sets *error on failure.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Serialize with sorted keys and fixed 6-digit double formatting.
std::string to_json(const Value& v);
std::string to_json(const Object& obj);

std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

std::string format_double(double d);

// Typed extractors. Missing keys or wrong types yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::optional<double> get_number(const Object& obj, const std::string& key);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

}  // namespace arf::jsonlite
