// Minimal JSON writer for state reports (no external dependencies).
//
// String-builder approach: callers emit keys and values in order and the
// writer tracks separators. It never parses and does not validate
// structure (begin/end pairs are the caller's responsibility).

#ifndef VITALS_CORE_JSON_HELPERS_H
#define VITALS_CORE_JSON_HELPERS_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vitals {

/// @brief Incremental JSON string builder.
///
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.field("metric", "hrv");
///   writer.field("value", 48.5);
///   writer.endObject();
///   // -> {"metric":"hrv","value":48.5}
/// @endcode
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key; the next call must write its value.
  void key(std::string_view name);

  void value(std::string_view val);
  void value(const char* val) { value(std::string_view(val)); }
  void value(int64_t val);
  void value(int val) { value(static_cast<int64_t>(val)); }
  void value(uint32_t val) { value(static_cast<int64_t>(val)); }
  /// Non-finite doubles are written as null.
  void value(double val);
  void value(bool val);
  void valueNull();

  /// @brief key() followed by value().
  template <typename T>
  void field(std::string_view name, const T& val) {
    key(name);
    value(val);
  }

  /// @brief key() followed by the value, or null when empty.
  template <typename T>
  void optionalField(std::string_view name, const std::optional<T>& val) {
    key(name);
    if (val.has_value()) {
      value(*val);
    } else {
      valueNull();
    }
  }

  /// @brief Compact JSON text.
  const std::string& toString() const { return buffer_; }

  /// @brief JSON text re-indented with newlines.
  /// @param indent_size Spaces per nesting level.
  std::string toPrettyString(int indent_size = 2) const;

 private:
  /// Emit a pending separator and mark the current level as non-empty.
  void separate();
  void open(char bracket);
  void close(char bracket);

  static void appendEscaped(std::string& out, std::string_view input);

  std::string buffer_;
  // One entry per open container: true once it holds an element.
  std::vector<bool> has_element_;
  bool after_key_ = false;
};

}  // namespace vitals

#endif  // VITALS_CORE_JSON_HELPERS_H
