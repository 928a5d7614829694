#pragma once
#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

namespace weed {

// Whole-token decimal parse; no sign, no whitespace, no trailing bytes.
template <typename T>
std::optional<T> parseUnsigned(std::string_view s) {
  if (s.empty()) return std::nullopt;
  T value{};
  auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || end != s.data() + s.size()) return std::nullopt;
  return value;
}

} // namespace weed
