#ifndef NORMA_CORE_JSON_UTILS_HPP_
#define NORMA_CORE_JSON_UTILS_HPP_

#include "core/time_utils.hpp"

#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace norma::core {

// Shared JSON string escaping for state snapshots, trace events and prompts.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

// Small append-only builder for flat-or-nested JSON objects. Field order is
// the call order, which keeps snapshot output stable for tests and diffs.
class JsonObjectWriter {
public:
  JsonObjectWriter() {
    out_ << '{';
  }

  JsonObjectWriter& String(std::string_view key, std::string_view value) {
    Key(key);
    out_ << '"' << EscapeJson(value) << '"';
    return *this;
  }

  JsonObjectWriter& Number(std::string_view key, double value, int precision = 3) {
    Key(key);
    out_ << FormatFixedDouble(value, precision);
    return *this;
  }

  JsonObjectWriter& Integer(std::string_view key, long long value) {
    Key(key);
    out_ << value;
    return *this;
  }

  JsonObjectWriter& Bool(std::string_view key, bool value) {
    Key(key);
    out_ << (value ? "true" : "false");
    return *this;
  }

  JsonObjectWriter& Null(std::string_view key) {
    Key(key);
    out_ << "null";
    return *this;
  }

  // `raw_json` must already be a serialized JSON value.
  JsonObjectWriter& Raw(std::string_view key, std::string_view raw_json) {
    Key(key);
    out_ << raw_json;
    return *this;
  }

  std::string Finish() {
    out_ << '}';
    return out_.str();
  }

private:
  void Key(std::string_view key) {
    if (!first_) {
      out_ << ',';
    }
    first_ = false;
    out_ << '"' << EscapeJson(key) << "\":";
  }

  std::ostringstream out_;
  bool first_ = true;
};

} // namespace norma::core

#endif // NORMA_CORE_JSON_UTILS_HPP_
