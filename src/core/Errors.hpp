#pragma once
#include <stdexcept>
#include <string>

namespace weed {

enum class ErrorKind {
  MalformedHandle,
  MalformedAddress,
  InvalidRequest,
  FileNotFound,
  NotCreated,
  NotAccepted,
  TransportFailure
};

const char* toString(ErrorKind kind);

// Every failure of the client surfaces as a WeedError; branch on kind().
// detail() holds the server's response body when there was one.
class WeedError : public std::runtime_error {
public:
  WeedError(ErrorKind kind, const std::string& detail);

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& detail() const noexcept { return detail_; }

private:
  ErrorKind kind_;
  std::string detail_;
};

} // namespace weed
