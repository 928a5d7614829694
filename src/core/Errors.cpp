#include "Errors.hpp"

namespace weed {

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MalformedHandle:  return "MalformedHandle";
    case ErrorKind::MalformedAddress: return "MalformedAddress";
    case ErrorKind::InvalidRequest:   return "InvalidRequest";
    case ErrorKind::FileNotFound:     return "FileNotFound";
    case ErrorKind::NotCreated:       return "NotCreated";
    case ErrorKind::NotAccepted:      return "NotAccepted";
    case ErrorKind::TransportFailure: return "TransportFailure";
  }
  return "Unknown";
}

static std::string describe(ErrorKind kind, const std::string& detail) {
  std::string msg = toString(kind);
  switch (kind) {
    case ErrorKind::MalformedHandle:
      msg += ": expected volumeId,key[_generation]";
      break;
    case ErrorKind::MalformedAddress:
      msg += ": expected host:port, for example 127.0.0.1:9333";
      break;
    case ErrorKind::InvalidRequest:
      msg += ": status was not 200 OK";
      break;
    case ErrorKind::FileNotFound:
      msg += ": file not found on volume server";
      break;
    case ErrorKind::NotCreated:
      msg += ": status was not 201 Created";
      break;
    case ErrorKind::NotAccepted:
      msg += ": status was not 202 Accepted";
      break;
    case ErrorKind::TransportFailure:
      break;
  }
  if (!detail.empty()) msg += " (" + detail + ")";
  return msg;
}

WeedError::WeedError(ErrorKind kind, const std::string& detail)
  : std::runtime_error(describe(kind, detail)), kind_(kind), detail_(detail) {}

} // namespace weed
