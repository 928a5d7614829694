#pragma once
#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace weed {

// Header names compare without regard to case, as httplib::Headers do.
struct CaseInsensitiveLess {
  bool operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
          return std::tolower(x) < std::tolower(y);
        });
  }
};

using Headers = std::multimap<std::string, std::string, CaseInsensitiveLess>;

struct HttpResponse {
  int status = 0;
  Headers headers;
  std::string body;
};

// One field of a multipart/form-data upload.
struct FormPart {
  std::string name;
  std::string content;
  std::string filename;
  std::string content_type;
};

// Passed straight to the HTTP library; unset values keep its defaults.
struct TransportOptions {
  std::optional<int> connect_timeout_sec;
  std::optional<int> read_timeout_sec;
  std::optional<int> write_timeout_sec;
};

// The four verbs the clients need. baseUrl is "http://host:port", target is
// an already-encoded "/path?query". Implementations throw
// WeedError(TransportFailure) when no response arrives; any status that did
// arrive is returned as-is.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse get(const std::string& baseUrl, const std::string& target) = 0;
  virtual HttpResponse put(const std::string& baseUrl, const std::string& target,
                           const std::string& body, const std::string& contentType) = 0;
  virtual HttpResponse postForm(const std::string& baseUrl, const std::string& target,
                                const std::vector<FormPart>& parts) = 0;
  virtual HttpResponse del(const std::string& baseUrl, const std::string& target) = 0;
};

} // namespace weed
