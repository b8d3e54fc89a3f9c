#include "TestHeaders.hpp"
#include "Transport.hpp"

using namespace wt;

TEST_CASE("WebSocket urls follow the api url", "[Transport]") {
  REQUIRE(getWebSocketUrl("http://localhost:3000", TERMINAL_ENDPOINT_PATH) ==
          "ws://localhost:3000/ssh");
  REQUIRE(getWebSocketUrl("https://proxy.example.com/api/v1",
                          FILE_BROWSER_ENDPOINT_PATH) ==
          "wss://proxy.example.com/sftp");
  REQUIRE(getWebSocketUrl("HTTPS://Proxy:8443", "/ssh") ==
          "wss://Proxy:8443/ssh");
  REQUIRE(getWebSocketUrl("wss://proxy", "/sftp") == "wss://proxy/sftp");
}

TEST_CASE("WebSocket urls without a scheme default to ws", "[Transport]") {
  REQUIRE(getWebSocketUrl("example.org:9000/", "/ssh") ==
          "ws://example.org:9000/ssh");
  REQUIRE(getWebSocketUrl("", "/ssh") == "ws://localhost:3000/ssh");
}
