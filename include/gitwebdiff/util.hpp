#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace gitwebdiff {
namespace util {

inline std::string json_escape(const std::string &s) {
  std::string o;
  o.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
    case '\"': o += "\\\""; break;
    case '\\': o += "\\\\"; break;
    case '\b': o += "\\b"; break;
    case '\f': o += "\\f"; break;
    case '\n': o += "\\n"; break;
    case '\r': o += "\\r"; break;
    case '\t': o += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        const char *hexd = "0123456789abcdef";
        o += "\\u00";
        o.push_back(hexd[(c >> 4) & 0xF]);
        o.push_back(hexd[c & 0xF]);
      } else {
        o.push_back(c);
      }
    }
  }
  return o;
}

inline std::string json_quote(const std::string &s) { return "\"" + json_escape(s) + "\""; }

inline std::string json_string_array(const std::vector<std::string> &v) {
  std::string out = "[";
  for (std::size_t i = 0; i < v.size(); ++i) {
    if (i)
      out += ",";
    out += json_quote(v[i]);
  }
  return out + "]";
}

inline const char *json_bool(bool b) { return b ? "true" : "false"; }

// Parses a non-negative decimal index; false on anything else.
inline bool parse_index(const std::string &s, std::size_t &out) {
  if (s.empty() || s.size() > 9)
    return false;
  std::size_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9')
      return false;
    v = v * 10 + static_cast<std::size_t>(c - '0');
  }
  out = v;
  return true;
}

} // namespace util
} // namespace gitwebdiff
