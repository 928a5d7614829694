#include "Query.hpp"

namespace weed {

static bool is_unreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_' || c == '.' || c == '~';
}

std::string percentEncode(std::string_view s, std::string_view keep) {
  static const char* k = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) {
    if (is_unreserved(c) || keep.find(static_cast<char>(c)) != std::string_view::npos) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(k[(c >> 4) & 0xF]);
      out.push_back(k[c & 0xF]);
    }
  }
  return out;
}

std::string Query::str() const {
  std::string out;
  for (const auto& [key, value] : params_) {
    if (!out.empty()) out.push_back('&');
    out += percentEncode(key);
    out.push_back('=');
    out += percentEncode(value);
  }
  return out;
}

std::string makeTarget(const std::string& path, const Query& query) {
  if (query.empty()) return path;
  return path + "?" + query.str();
}

} // namespace weed
