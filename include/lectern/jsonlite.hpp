#pragma once

// lectern/jsonlite.hpp - Minimal strict JSON reader for config files and
// position records.
//
// Numbers: non-negative integers parse as uint64_t, everything else (fractions,
// exponents, negative integers) as double. NaN/Infinity are rejected.
// Duplicate object keys are rejected.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lectern::jsonlite {

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

// Parse a JSON document whose top level must be an object. On failure returns an
// empty Object and sets *error (when non-null).
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string get_string(const Object& obj, const std::string& key, const std::string& def);
bool get_bool(const Object& obj, const std::string& key, bool def);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def);
double get_double(const Object& obj, const std::string& key, double def);
bool has_key(const Object& obj, const std::string& key);

std::string escape(const std::string& s);

// Fixed six-decimal formatting with trailing zeros trimmed ("1.5", "0.0").
std::string format_double(double d);

}  // namespace lectern::jsonlite
