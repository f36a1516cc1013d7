// Implementation of the flat-object JSON parser.

#include "core/json_parser.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace vitals {

double JsonValue::asDouble(double default_val) const {
  if (type == Number) return number_val;
  return default_val;
}

bool fitsInt64(double val) {
  // -2^63 is exact as a double; 2^63 itself is already out of range.
  constexpr double kLow = static_cast<double>(std::numeric_limits<int64_t>::min());
  return std::isfinite(val) && val >= kLow && val < -kLow;
}

int64_t JsonValue::asInt64(int64_t default_val) const {
  if (type == Number && fitsInt64(number_val)) return static_cast<int64_t>(number_val);
  return default_val;
}

bool JsonValue::asBool(bool default_val) const {
  if (type == Bool) return bool_val;
  return default_val;
}

std::string JsonValue::asString(const std::string& default_val) const {
  if (type == String) return string_val;
  return default_val;
}

namespace {

/// Cursor over the input; every helper reports failure through ok=false.
struct Cursor {
  std::string_view text;
  size_t pos = 0;
  bool ok = true;
  std::string error;

  bool atEnd() const { return pos >= text.size(); }
  char peek() const { return atEnd() ? '\0' : text[pos]; }

  void fail(const char* what) {
    if (!ok) return;
    ok = false;
    error = std::string(what) + " at offset " + std::to_string(pos);
  }

  void skipWhitespace() {
    while (!atEnd() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
  }

  bool consumeLiteral(std::string_view literal) {
    if (text.substr(pos, literal.size()) != literal) return false;
    pos += literal.size();
    return true;
  }
};

std::string parseString(Cursor& cur) {
  std::string result;
  if (cur.peek() != '"') {
    cur.fail("expected string");
    return result;
  }
  ++cur.pos;
  while (!cur.atEnd() && cur.peek() != '"') {
    char chr = cur.text[cur.pos];
    if (chr == '\\' && cur.pos + 1 < cur.text.size()) {
      ++cur.pos;
      switch (cur.text[cur.pos]) {
        case 'n': result += '\n'; break;
        case 't': result += '\t'; break;
        case 'r': result += '\r'; break;
        case 'b': result += '\b'; break;
        case 'f': result += '\f'; break;
        default:  result += cur.text[cur.pos]; break;
      }
    } else {
      result += chr;
    }
    ++cur.pos;
  }
  if (cur.atEnd()) {
    cur.fail("unterminated string");
    return result;
  }
  ++cur.pos;  // closing quote
  return result;
}

JsonValue parseNumber(Cursor& cur) {
  JsonValue val;
  val.type = JsonValue::Number;
  const size_t start = cur.pos;
  if (cur.peek() == '-' || cur.peek() == '+') ++cur.pos;
  while (!cur.atEnd()) {
    char chr = cur.peek();
    if (std::isdigit(static_cast<unsigned char>(chr)) || chr == '.' || chr == 'e' ||
        chr == 'E' || chr == '-' || chr == '+') {
      ++cur.pos;
    } else {
      break;
    }
  }
  std::string num_str(cur.text.substr(start, cur.pos - start));
  char* end_ptr = nullptr;
  val.number_val = std::strtod(num_str.c_str(), &end_ptr);
  if (num_str.empty() || end_ptr != num_str.c_str() + num_str.size()) {
    cur.pos = start;
    cur.fail("malformed number");
  }
  return val;
}

/// Skip a nested object or array, honouring strings.
void skipContainer(Cursor& cur) {
  const char open = cur.peek();
  const char close = (open == '{') ? '}' : ']';
  int depth = 0;
  while (!cur.atEnd()) {
    char chr = cur.peek();
    if (chr == '"') {
      parseString(cur);
      if (!cur.ok) return;
      continue;
    }
    if (chr == open) ++depth;
    if (chr == close) {
      --depth;
      if (depth == 0) {
        ++cur.pos;
        return;
      }
    }
    ++cur.pos;
  }
  cur.fail("unterminated container");
}

}  // namespace

JsonParseResult parseJsonObject(std::string_view json) {
  JsonParseResult result;
  Cursor cur;
  cur.text = json;

  cur.skipWhitespace();
  if (cur.peek() != '{') {
    cur.fail("expected '{'");
    result.error_message = cur.error;
    return result;
  }
  ++cur.pos;

  bool expect_entry = true;
  while (cur.ok) {
    cur.skipWhitespace();
    if (cur.atEnd()) {
      cur.fail("unexpected end of input");
      break;
    }
    if (cur.peek() == '}') {
      ++cur.pos;
      break;
    }
    if (!expect_entry) {
      if (cur.peek() != ',') {
        cur.fail("expected ',' or '}'");
        break;
      }
      ++cur.pos;
      cur.skipWhitespace();
    }

    std::string key = parseString(cur);
    if (!cur.ok) break;

    cur.skipWhitespace();
    if (cur.peek() != ':') {
      cur.fail("expected ':'");
      break;
    }
    ++cur.pos;
    cur.skipWhitespace();

    const char lead = cur.peek();
    if (lead == '"') {
      JsonValue val;
      val.type = JsonValue::String;
      val.string_val = parseString(cur);
      result.values[key] = val;
    } else if (lead == '{' || lead == '[') {
      skipContainer(cur);
    } else if (cur.consumeLiteral("true") || cur.consumeLiteral("false")) {
      JsonValue val;
      val.type = JsonValue::Bool;
      val.bool_val = (lead == 't');
      result.values[key] = val;
    } else if (cur.consumeLiteral("null")) {
      result.values[key] = JsonValue{};
    } else {
      result.values[key] = parseNumber(cur);
    }
    expect_entry = false;
  }

  if (cur.ok) {
    cur.skipWhitespace();
    if (!cur.atEnd()) cur.fail("trailing characters");
  }

  result.success = cur.ok;
  if (!cur.ok) {
    result.values.clear();
    result.error_message = cur.error;
  }
  return result;
}

}  // namespace vitals
