// Flat-object JSON parser for engine configuration (no external dependencies).
//
// Accepts a single top-level object whose values are strings, numbers,
// booleans or null. Nested objects and arrays are skipped, not rejected.

#ifndef VITALS_CORE_JSON_PARSER_H
#define VITALS_CORE_JSON_PARSER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace vitals {

/// @brief A single scalar JSON value.
struct JsonValue {
  enum Type { String, Number, Bool, Null };
  Type type = Null;
  std::string string_val;
  double number_val = 0.0;
  bool bool_val = false;

  bool isNumber() const { return type == Number; }
  bool isBool() const { return type == Bool; }
  bool isString() const { return type == String; }

  double asDouble(double default_val = 0.0) const;
  /// @brief Truncated number, or default_val when not a number or outside int64 range.
  int64_t asInt64(int64_t default_val = 0) const;
  bool asBool(bool default_val = false) const;
  std::string asString(const std::string& default_val = "") const;
};

using JsonObject = std::map<std::string, JsonValue>;

/// Result of parsing a flat JSON object.
struct JsonParseResult {
  bool success = false;
  JsonObject values;
  std::string error_message;  ///< Set when success is false.
};

/// @brief True when a finite double converts to int64_t without overflow.
bool fitsInt64(double val);

/// @brief Parse a flat JSON object into a key-value map.
/// @param json JSON text.
/// @return Parsed values, or success=false with a message naming the offset.
JsonParseResult parseJsonObject(std::string_view json);

}  // namespace vitals

#endif  // VITALS_CORE_JSON_PARSER_H
