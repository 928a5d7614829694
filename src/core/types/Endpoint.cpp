#include "Endpoint.hpp"
#include "Numbers.hpp"
#include "core/Errors.hpp"

namespace weed {

Endpoint Endpoint::parse(std::string_view text) {
  const auto colon = text.find(':');
  std::string_view host = text.substr(0, colon);
  if (host.empty()) throw WeedError(ErrorKind::MalformedAddress, std::string(text));

  Endpoint ep{std::string(host), std::nullopt};
  if (colon == std::string_view::npos) return ep;

  ep.port = parseUnsigned<uint16_t>(text.substr(colon + 1));
  if (!ep.port) throw WeedError(ErrorKind::MalformedAddress, std::string(text));
  return ep;
}

std::string Endpoint::baseUrl() const {
  return "http://" + host + ":" + std::to_string(port.value_or(kDefaultPort));
}

} // namespace weed
