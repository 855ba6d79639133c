#pragma once

// cra/jsonlite.hpp: Minimal JSON value model, strict parser, canonical writer.
//
// DETERMINISM GUARANTEES:
//   - to_json() emits objects with keys in lexicographic order (std::map
//     iteration) and no insignificant whitespace. Two documents that differ only
//     in key order or spacing canonicalize to identical bytes.
//   - Integers keep their integer spelling. Doubles go through format_double()
//     ("%.6f" with trailing zeros trimmed), which is locale-independent.
//
// The TRACE hash chain hashes to_json() output, so any change to the writer is a
// chain format change and requires bumping version::CHAIN_HASH_VERSION.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cra::jsonlite {

struct Value;
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::int64_t, std::uint64_t, double, std::string, Object, Array> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(int i) : v(static_cast<std::int64_t>(i)) {}
  Value(unsigned u) : v(static_cast<std::uint64_t>(u)) {}
  Value(std::int64_t i) : v(i) {}
  Value(std::uint64_t u) : v(u) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Object o) : v(std::move(o)) {}
  Value(Array a) : v(std::move(a)) {}

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(v); }
  bool is_object() const { return std::holds_alternative<Object>(v); }
  bool is_array() const { return std::holds_alternative<Array>(v); }
  bool is_string() const { return std::holds_alternative<std::string>(v); }

  bool operator==(const Value& other) const { return v == other.v; }
  bool operator!=(const Value& other) const { return !(*this == other); }
};

struct JsonError {
  std::string code;     // "json_parse_error" | "json_duplicate_key"
  std::string message;
};

// Strict parse. Duplicate keys, trailing data, NaN/Infinity are errors.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

// Parse a document whose root must be an object. Returns {} on error.
Object parse(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

// Canonical serialization (sorted keys, compact).
std::string to_json(const Value& v);
std::string canonicalize_json(const std::string& text, std::optional<JsonError>* error);

std::string escape(const std::string& s);
std::string format_double(double d);

// Array of strings helper for building payloads.
Array string_array(const std::vector<std::string>& items);

// Type-safe extractors. Missing keys and type mismatches yield the default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");
bool get_bool(const Object& obj, const std::string& key, bool def = false);
std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def = 0);
std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def = 0);
double get_double(const Object& obj, const std::string& key, double def = 0.0);
std::vector<std::string> get_string_array(const Object& obj, const std::string& key);
std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key);

// Borrowed views into nested containers; nullptr when absent or mistyped.
const Object* get_object(const Object& obj, const std::string& key);
const Array* get_array(const Object& obj, const std::string& key);

}  // namespace cra::jsonlite
