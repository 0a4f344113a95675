#include "RelayUrl.hpp"

#include "TestHeaders.hpp"

using namespace pt;

TEST_CASE("RelayUrl parses relay endpoints", "[RelayUrl]") {
  SECTION("Secure with default port") {
    RelayUrl url = RelayUrl::parse("wss://relay.example.com/ws");
    REQUIRE(url.secure);
    REQUIRE(url.host == "relay.example.com");
    REQUIRE(url.port == 443);
    REQUIRE(url.target == "/ws");
  }

  SECTION("Plain with explicit port and no path") {
    RelayUrl url = RelayUrl::parse("ws://127.0.0.1:8080");
    REQUIRE_FALSE(url.secure);
    REQUIRE(url.host == "127.0.0.1");
    REQUIRE(url.port == 8080);
    REQUIRE(url.target == "/");
  }

  SECTION("IPv6 literal") {
    RelayUrl url = RelayUrl::parse("ws://[::1]:9000/relay/ws");
    REQUIRE(url.host == "::1");
    REQUIRE(url.port == 9000);
    REQUIRE(url.target == "/relay/ws");
    REQUIRE(url.toString() == "ws://[::1]:9000/relay/ws");
  }

  SECTION("Default port is omitted when printed") {
    REQUIRE(RelayUrl::parse("wss://relay.example.com:443/ws").toString() ==
            "wss://relay.example.com/ws");
  }
}

TEST_CASE("RelayUrl rejects malformed urls", "[RelayUrl]") {
  REQUIRE_THROWS_AS(RelayUrl::parse("https://relay.example.com"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(RelayUrl::parse("ws://"), std::runtime_error);
  REQUIRE_THROWS_AS(RelayUrl::parse("ws://:80"), std::runtime_error);
  REQUIRE_THROWS_AS(RelayUrl::parse("ws://host:"), std::runtime_error);
  REQUIRE_THROWS_AS(RelayUrl::parse("ws://host:0"), std::runtime_error);
  REQUIRE_THROWS_AS(RelayUrl::parse("ws://host:65536"), std::runtime_error);
  REQUIRE_THROWS_AS(RelayUrl::parse("ws://host:99999999999"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(RelayUrl::parse("ws://host:8o"), std::runtime_error);
  REQUIRE_THROWS_AS(RelayUrl::parse("ws://[::1"), std::runtime_error);
}

TEST_CASE("RelayUrl socket endpoint", "[RelayUrl]") {
  REQUIRE(RelayUrl::socketEndpoint("wss://relay.chell.app") ==
          "wss://relay.chell.app/ws");
  REQUIRE(RelayUrl::socketEndpoint("wss://relay.chell.app/") ==
          "wss://relay.chell.app/ws");
  REQUIRE(RelayUrl::socketEndpoint("ws://localhost:3000/base//") ==
          "ws://localhost:3000/base/ws");
}
