#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace weed {

// Percent-encodes everything outside the RFC 3986 unreserved set, except
// the bytes listed in keep.
std::string percentEncode(std::string_view s, std::string_view keep = {});

// Ordered query string. Unset optionals are left out entirely.
class Query {
public:
  Query& add(const std::string& key, const std::string& value) {
    params_.emplace_back(key, value);
    return *this;
  }
  Query& add(const std::string& key, const char* value) {
    return add(key, std::string(value));
  }
  Query& add(const std::string& key, bool value) {
    return add(key, std::string(value ? "true" : "false"));
  }
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>>>
  Query& add(const std::string& key, T value) {
    return add(key, std::to_string(value));
  }

  template <typename T>
  Query& add(const std::string& key, const std::optional<T>& value) {
    if (value) add(key, *value);
    return *this;
  }

  bool empty() const { return params_.empty(); }
  std::string str() const;

private:
  std::vector<std::pair<std::string, std::string>> params_;
};

// "/path" or "/path?query" when the query has entries.
std::string makeTarget(const std::string& path, const Query& query);

} // namespace weed
