#ifndef LABGATE_CORE_JSON_UTILS_HPP_
#define LABGATE_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace labgate::core {

// Shared JSON string escaping for every serializer (results, health reports,
// events, outbound payloads).
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

// Integral values print without a fractional part so relayed counters such as
// `"latency_ms":120` round-trip unchanged. JSON has no NaN/Inf; those become
// null.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  if (std::floor(value) == value && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<std::int64_t>(value));
  }
  std::ostringstream out;
  out << std::setprecision(15) << value;
  return out.str();
}

} // namespace labgate::core

#endif // LABGATE_CORE_JSON_UTILS_HPP_
