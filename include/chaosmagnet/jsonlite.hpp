#pragma once

// chaosmagnet/jsonlite.hpp: Minimal strict JSON parser and canonical writer.
//
// DETERMINISM GUARANTEES:
//   - to_json() emits objects with sorted keys (std::map iteration) and no
//     whitespace, so equal values always serialize to equal bytes. The mint
//     digest and the frame metrics digest rely on this.
//   - format_double() always uses 6 decimal places with trailing-zero trimming.
//
// STRICTNESS (RFC 8259 plus):
//   - Duplicate object keys are rejected (json_duplicate_key).
//   - NaN/Infinity, leading zeros, raw control characters in strings, unpaired
//     surrogates and trailing data are rejected (json_parse_error).
//   - Nesting is capped at 32 levels.
//   - JsonError.message carries the byte offset of the failure.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace chaosmagnet::jsonlite {

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Object, Array> v;
};

std::optional<JsonError> validate_strict(const std::string& text);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Returns an empty object (and sets *error) on failure or
// when the top-level value is not an object.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string format_double(double d);
std::string escape(const std::string& s);

// Type-safe extractors. Missing keys or mismatched types return def.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);  // accepts integers
const Object* get_object(const Object& obj, const std::string& key);

// Type checks for validation code that must distinguish "absent" from "wrong type".
bool has_key(const Object& obj, const std::string& key);
bool is_number(const Object& obj, const std::string& key);

}  // namespace chaosmagnet::jsonlite
