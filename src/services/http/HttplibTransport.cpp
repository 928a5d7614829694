#include "HttplibTransport.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace weed {

static void apply_options(httplib::Client& cli, const TransportOptions& o) {
  if (o.connect_timeout_sec) cli.set_connection_timeout(*o.connect_timeout_sec, 0);
  if (o.read_timeout_sec)    cli.set_read_timeout(*o.read_timeout_sec, 0);
  if (o.write_timeout_sec)   cli.set_write_timeout(*o.write_timeout_sec, 0);
}

static HttpResponse to_response(httplib::Result& res,
                                const char* verb,
                                const std::string& baseUrl,
                                const std::string& target) {
  if (!res) {
    const std::string why = httplib::to_string(res.error());
    spdlog::warn("{} {}{} failed: {}", verb, baseUrl, target, why);
    throw WeedError(ErrorKind::TransportFailure,
                    std::string(verb) + " " + baseUrl + target + ": " + why);
  }
  HttpResponse out;
  out.status = res->status;
  out.headers.insert(res->headers.begin(), res->headers.end());
  out.body = res->body;
  return out;
}

HttpResponse HttplibTransport::get(const std::string& baseUrl, const std::string& target) {
  httplib::Client cli(baseUrl);
  apply_options(cli, options_);
  auto res = cli.Get(target);
  return to_response(res, "GET", baseUrl, target);
}

HttpResponse HttplibTransport::put(const std::string& baseUrl, const std::string& target,
                                   const std::string& body, const std::string& contentType) {
  httplib::Client cli(baseUrl);
  apply_options(cli, options_);
  auto res = cli.Put(target, body, contentType);
  return to_response(res, "PUT", baseUrl, target);
}

HttpResponse HttplibTransport::postForm(const std::string& baseUrl, const std::string& target,
                                        const std::vector<FormPart>& parts) {
  httplib::MultipartFormDataItems items;
  items.reserve(parts.size());
  for (const auto& p : parts) {
    items.push_back({p.name, p.content, p.filename, p.content_type});
  }

  httplib::Client cli(baseUrl);
  apply_options(cli, options_);
  auto res = cli.Post(target, items);
  return to_response(res, "POST", baseUrl, target);
}

HttpResponse HttplibTransport::del(const std::string& baseUrl, const std::string& target) {
  httplib::Client cli(baseUrl);
  apply_options(cli, options_);
  auto res = cli.Delete(target);
  return to_response(res, "DELETE", baseUrl, target);
}

std::shared_ptr<HttpTransport> defaultTransport() {
  static const auto shared = std::make_shared<HttplibTransport>();
  return shared;
}

} // namespace weed
