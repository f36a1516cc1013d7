/// @file
/// @brief JsonWriter implementation.

#include "core/json_helpers.h"

#include <cmath>
#include <cstdio>

namespace vitals {

void JsonWriter::separate() {
  if (after_key_) {
    // Value directly follows its key.
    after_key_ = false;
    return;
  }
  if (!has_element_.empty()) {
    if (has_element_.back()) buffer_ += ',';
    has_element_.back() = true;
  }
}

void JsonWriter::open(char bracket) {
  separate();
  buffer_ += bracket;
  has_element_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!has_element_.empty()) has_element_.pop_back();
}

void JsonWriter::beginObject() { open('{'); }
void JsonWriter::endObject() { close('}'); }
void JsonWriter::beginArray() { open('['); }
void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  separate();
  buffer_ += '"';
  appendEscaped(buffer_, name);
  buffer_ += "\":";
  after_key_ = true;
}

void JsonWriter::value(std::string_view val) {
  separate();
  buffer_ += '"';
  appendEscaped(buffer_, val);
  buffer_ += '"';
}

void JsonWriter::value(int64_t val) {
  separate();
  buffer_ += std::to_string(val);
}

void JsonWriter::value(double val) {
  separate();
  if (!std::isfinite(val)) {
    buffer_ += "null";
    return;
  }
  // %.10g keeps scores like 83.33333333 readable and round values short.
  char num_buf[32];
  std::snprintf(num_buf, sizeof(num_buf), "%.10g", val);
  buffer_ += num_buf;
}

void JsonWriter::value(bool val) {
  separate();
  buffer_ += val ? "true" : "false";
}

void JsonWriter::valueNull() {
  separate();
  buffer_ += "null";
}

std::string JsonWriter::toPrettyString(int indent_size) const {
  std::string out;
  out.reserve(buffer_.size() * 2);

  int depth = 0;
  bool in_string = false;
  bool escaped = false;

  auto newline = [&]() {
    out += '\n';
    out.append(static_cast<size_t>(depth * indent_size), ' ');
  };

  for (size_t pos = 0; pos < buffer_.size(); ++pos) {
    const char chr = buffer_[pos];

    if (in_string) {
      out += chr;
      if (escaped) {
        escaped = false;
      } else if (chr == '\\') {
        escaped = true;
      } else if (chr == '"') {
        in_string = false;
      }
      continue;
    }

    switch (chr) {
      case '"':
        in_string = true;
        out += chr;
        break;
      case '{':
      case '[': {
        out += chr;
        const char next = pos + 1 < buffer_.size() ? buffer_[pos + 1] : '\0';
        ++depth;
        if (next != '}' && next != ']') newline();
        break;
      }
      case '}':
      case ']':
        --depth;
        if (!out.empty() && out.back() != '{' && out.back() != '[') newline();
        out += chr;
        break;
      case ',':
        out += chr;
        newline();
        break;
      case ':':
        out += ": ";
        break;
      default:
        out += chr;
        break;
    }
  }
  return out;
}

void JsonWriter::appendEscaped(std::string& out, std::string_view input) {
  for (char chr : input) {
    switch (chr) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          out += hex_buf;
        } else {
          out += chr;
        }
        break;
    }
  }
}

}  // namespace vitals
