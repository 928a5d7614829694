#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "core/types/Endpoint.hpp"

using namespace weed;

TEST(EndpointTest, ParsesHostAndPort) {
  const Endpoint ep = Endpoint::parse("1.1.1.1:8080");
  EXPECT_EQ(ep.host, "1.1.1.1");
  ASSERT_TRUE(ep.port.has_value());
  EXPECT_EQ(*ep.port, 8080);
  EXPECT_EQ(ep.baseUrl(), "http://1.1.1.1:8080");
}

TEST(EndpointTest, MissingPortUsesDefault) {
  const Endpoint ep = Endpoint::parse("localhost");
  EXPECT_FALSE(ep.port.has_value());
  EXPECT_EQ(ep.baseUrl(), "http://localhost:9333");
}

TEST(EndpointTest, RejectsBadAddresses) {
  for (const char* bad : {"", ":9333", "host:", "host:port", "host:70000", "host:1:2"}) {
    try {
      Endpoint::parse(bad);
      FAIL() << "parsed '" << bad << "'";
    } catch (const WeedError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::MalformedAddress) << bad;
    }
  }
}
