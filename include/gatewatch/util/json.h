#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace gatewatch::json {

struct Value;
using Array = std::vector<Value>;
// Ordered so stringify() output is stable for saves and diffs.
using Object = std::map<std::string, Value>;

// JSON value: null, bool, number, string, array, object.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  // Integer convenience constructors (stored as double).
  Value(int v) : variant(static_cast<double>(v)) {}
  Value(std::int64_t v) : variant(static_cast<double>(v)) {}
  Value(const char* s) : variant(std::string(s)) {}

  bool is_null() const;
  bool is_bool() const;
  bool is_number() const;
  bool is_string() const;
  bool is_array() const;
  bool is_object() const;

  const Array* as_array() const;
  const Object* as_object() const;

  // Returns nullptr when this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  // Throws std::runtime_error if not present / wrong type.
  const Value& at(const std::string& key) const;

  bool bool_value(bool def = false) const;
  double number_value(double def = 0.0) const;
  std::int64_t int_value(std::int64_t def = 0) const;
  std::string string_value(const std::string& def = "") const;

  // Throw std::runtime_error on wrong type.
  const Object& object() const;
  const Array& array() const;
};

// Parses a document. Errors throw std::runtime_error with line/column and a
// caret under the offending character.
Value parse(const std::string& text);

std::string stringify(const Value& v, int indent = 2);

} // namespace gatewatch::json
