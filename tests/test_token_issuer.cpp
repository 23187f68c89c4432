#include "doctest/doctest.h"
#include "mlink/errors.hpp"
#include "mlink/token_issuer.hpp"

#include <set>
#include <stdexcept>

using namespace mlink;

namespace {

AddressProvider fixed(std::vector<std::string> addrs) {
  return [addrs] { return addrs; };
}

} // namespace

DOCTEST_TEST_CASE("generated tokens are url-safe and unique") {
  std::set<std::string> seen;
  for (int i = 0; i < 200; ++i) {
    std::string t = TokenIssuer::generate_token(MIN_TOKEN_BYTES);
    DOCTEST_REQUIRE_EQ(t.size(), 22u);
    DOCTEST_REQUIRE(t.find_first_not_of(
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_") == std::string::npos);
    seen.insert(t);
  }
  DOCTEST_CHECK_EQ(seen.size(), 200u);
  DOCTEST_CHECK_EQ(TokenIssuer::generate_token(32).size(), 43u);
}

DOCTEST_TEST_CASE("issue uses the first local address and matches only the current token") {
  TokenIssuer issuer(MIN_TOKEN_BYTES, "", fixed({"192.168.1.20", "10.0.0.5"}));
  DOCTEST_CHECK_FALSE(issuer.matches(""));

  ConnectionDescriptor d1 = issuer.issue(8080);
  DOCTEST_CHECK_EQ(d1.host, "192.168.1.20");
  DOCTEST_CHECK_EQ(d1.port, 8080);
  DOCTEST_CHECK(issuer.matches(d1.token));
  DOCTEST_CHECK_FALSE(issuer.matches(d1.token + "x"));
  DOCTEST_CHECK_FALSE(issuer.matches(""));

  ConnectionDescriptor d2 = issuer.issue(8080);
  DOCTEST_CHECK_NE(d1.token, d2.token);
  DOCTEST_CHECK_FALSE(issuer.matches(d1.token));
  DOCTEST_CHECK(issuer.matches(d2.token));

  issuer.revoke();
  DOCTEST_CHECK_FALSE(issuer.matches(d2.token));
}

DOCTEST_TEST_CASE("advertise host overrides address discovery") {
  TokenIssuer issuer(MIN_TOKEN_BYTES, "127.0.0.1", fixed({}));
  DOCTEST_CHECK_EQ(issuer.issue(9000).host, "127.0.0.1");
}

DOCTEST_TEST_CASE("no usable interface fails with NO_NETWORK_INTERFACE") {
  TokenIssuer issuer(MIN_TOKEN_BYTES, "", fixed({}));
  try {
    issuer.issue(8080);
    DOCTEST_FAIL("expected ServerError");
  } catch (const ServerError& e) {
    DOCTEST_CHECK(e.code() == ErrorCode::NO_NETWORK_INTERFACE);
  }
}

DOCTEST_TEST_CASE("pairing payload parses back into the same descriptor") {
  ConnectionDescriptor d{"192.168.0.7", 8080, "abcDEF123_-"};
  DOCTEST_CHECK(ConnectionDescriptor::from_payload(d.to_payload()) == d);
  DOCTEST_CHECK_EQ(d.to_uri(), "mouselink://192.168.0.7:8080/?token=abcDEF123_-");

  DOCTEST_CHECK_THROWS_AS(ConnectionDescriptor::from_payload("not json"), std::invalid_argument);
  DOCTEST_CHECK_THROWS_AS(ConnectionDescriptor::from_payload(R"({"v":2,"host":"h","port":1,"token":"t"})"),
                          std::invalid_argument);
  DOCTEST_CHECK_THROWS_AS(ConnectionDescriptor::from_payload(R"({"v":1,"host":"h"})"),
                          std::invalid_argument);
}

DOCTEST_TEST_CASE("tokens_equal compares full content") {
  DOCTEST_CHECK(tokens_equal("abc", "abc"));
  DOCTEST_CHECK_FALSE(tokens_equal("abc", "abd"));
  DOCTEST_CHECK_FALSE(tokens_equal("abc", "ab"));
}

DOCTEST_TEST_CASE("pairing payload with an out-of-range port is refused") {
  DOCTEST_CHECK_THROWS_AS(
    ConnectionDescriptor::from_payload(R"({"v":1,"host":"10.0.0.1","port":70000,"token":"t"})"),
    std::invalid_argument);
  DOCTEST_CHECK_THROWS_AS(
    ConnectionDescriptor::from_payload(R"({"v":1,"host":"10.0.0.1","port":-1,"token":"t"})"),
    std::invalid_argument);
  DOCTEST_CHECK_EQ(
    ConnectionDescriptor::from_payload(R"({"v":1,"host":"10.0.0.1","port":65535,"token":"t"})").port,
    65535);
}

DOCTEST_TEST_CASE("token size is clamped to the supported range") {
  TokenIssuer big(100000, "127.0.0.1", fixed({}));
  DOCTEST_CHECK_EQ(big.issue(1).token.size(), 342u);

  TokenIssuer small(1, "127.0.0.1", fixed({}));
  DOCTEST_CHECK_EQ(small.issue(1).token.size(), 22u);
}
