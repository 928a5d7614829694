#pragma once

#include <gmock/gmock.h>
#include <string>
#include <vector>

#include "services/http/HttpTransport.hpp"

namespace weed::test {

class MockTransport : public HttpTransport {
public:
  MOCK_METHOD(HttpResponse, get, (const std::string&, const std::string&), (override));
  MOCK_METHOD(HttpResponse, put,
              (const std::string&, const std::string&, const std::string&, const std::string&),
              (override));
  MOCK_METHOD(HttpResponse, postForm,
              (const std::string&, const std::string&, const std::vector<FormPart>&),
              (override));
  MOCK_METHOD(HttpResponse, del, (const std::string&, const std::string&), (override));
};

inline HttpResponse reply(int status, std::string body) {
  HttpResponse r;
  r.status = status;
  r.body = std::move(body);
  return r;
}

} // namespace weed::test
