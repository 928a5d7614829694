#pragma once
#include <memory>

#include "HttpTransport.hpp"

namespace weed {

// cpp-httplib backed transport. Holds no connection state: each call opens
// its own httplib::Client, so one instance can be shared across threads.
class HttplibTransport : public HttpTransport {
public:
  explicit HttplibTransport(TransportOptions options = {})
    : options_(options) {}

  HttpResponse get(const std::string& baseUrl, const std::string& target) override;
  HttpResponse put(const std::string& baseUrl, const std::string& target,
                   const std::string& body, const std::string& contentType) override;
  HttpResponse postForm(const std::string& baseUrl, const std::string& target,
                        const std::vector<FormPart>& parts) override;
  HttpResponse del(const std::string& baseUrl, const std::string& target) override;

private:
  TransportOptions options_;
};

std::shared_ptr<HttpTransport> defaultTransport();

} // namespace weed
