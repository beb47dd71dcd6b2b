#ifndef NUCLEOBENCH_CORE_JSON_WRITER_HPP_
#define NUCLEOBENCH_CORE_JSON_WRITER_HPP_

#include <charconv>
#include <cmath>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace nucleobench::core {

// Shared JSON string escaping for every persisted document.
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

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

inline std::string OptionalStringJson(const std::optional<std::string>& value) {
  return value.has_value() ? QuoteJson(value.value()) : std::string("null");
}

// Shortest text that parses back to the same double; null for NaN/inf.
inline std::string OptionalNumberJson(const std::optional<double>& value) {
  if (!value.has_value() || !std::isfinite(value.value())) {
    return "null";
  }
  char buffer[64] = {};
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value.value());
  if (ec != std::errc()) {
    return "null";
  }
  return std::string(buffer, ptr);
}

// Writes a string array in the two-space indented layout used by result
// records. `indent` is the indentation of the owning key.
inline void WriteStringArray(std::ostream& out, const std::vector<std::string>& values,
                             std::string_view indent) {
  if (values.empty()) {
    out << "[]";
    return;
  }
  out << "[\n";
  for (std::size_t i = 0; i < values.size(); ++i) {
    out << indent << "  " << QuoteJson(values[i]);
    if (i + 1 < values.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << indent << ']';
}

} // namespace nucleobench::core

#endif // NUCLEOBENCH_CORE_JSON_WRITER_HPP_
