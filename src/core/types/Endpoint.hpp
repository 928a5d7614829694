#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace weed {

constexpr uint16_t kDefaultPort = 9333;

struct Endpoint {
  std::string             host;
  std::optional<uint16_t> port;

  // Accepts "host:port" or a bare "host". Throws WeedError(MalformedAddress).
  static Endpoint parse(std::string_view text);

  // "http://host:port", falling back to kDefaultPort.
  std::string baseUrl() const;
};

} // namespace weed
