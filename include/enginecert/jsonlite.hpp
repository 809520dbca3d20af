#pragma once

// enginecert/jsonlite.hpp — Minimal strict JSON reader/writer.
//
// DETERMINISM GUARANTEES:
//   - to_json() emits compact output with object keys in byte order
//     (std::map iteration). This is the canonical form used for receipt
//     content hashes, baseline checksums and JSON file fingerprints.
//   - Numbers that do not fit std::uint64_t (negatives, fractions,
//     exponents, huge integers) are held as their exact source digits. Only
//     the exponent spelling is normalised (1E+05 -> 1e5), so 1 and 1.0 stay
//     distinct and no value change is rounded away.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace enginecert::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

// Exact decimal text of a number outside the std::uint64_t range.
struct Number {
  std::string text;
};

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, Number, std::string, Object, Array> v{nullptr};
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Parse any JSON value. On error *error is set and a null Value returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a JSON object. Returns an empty object on error or non-object input.
Object parse(const std::string& text, std::optional<JsonError>* error);

// Re-emit text in canonical form. Returns "" on error.
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

std::string to_json(const Value& v);
std::string escape(const std::string& s);

// Type-safe extractors
const Value* find(const Object& obj, const std::string& key);
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
unsigned long long get_u64(const Object& obj, const std::string& key, unsigned long long def = 0);
Object get_object(const Object& obj, const std::string& key);
Array get_array(const Object& obj, const std::string& key);

}  // namespace enginecert::jsonlite
