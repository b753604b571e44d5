#include "ctload/config.hpp"
#include "ctload/endpoint.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace ctload;

TEST_CASE("Endpoint - WebSocket URL", "[endpoint]") {
  auto ep = Endpoint::parse("ws://localhost:8080/");
  REQUIRE(ep.has_value());
  REQUIRE(ep.value().scheme() == Scheme::kWs);
  REQUIRE(ep.value().protocol() == Protocol::kWebSocket);
  REQUIRE(!ep.value().secure());
  REQUIRE(ep.value().host() == "localhost");
  REQUIRE(ep.value().port() == 8080);
  REQUIRE(ep.value().target() == "/");
  REQUIRE(ep.value().host_header() == "localhost:8080");
  REQUIRE(ep.value().url() == "ws://localhost:8080/");
}

TEST_CASE("Endpoint - default ports per scheme", "[endpoint]") {
  REQUIRE(Endpoint::parse("ws://example.com").value().port() == 80);
  REQUIRE(Endpoint::parse("wss://example.com").value().port() == 443);
  REQUIRE(Endpoint::parse("http://example.com/events").value().port() == 80);
  REQUIRE(Endpoint::parse("https://example.com/events").value().port() == 443);
  REQUIRE(Endpoint::parse("tcp://example.com").value().port() == 8081);
  REQUIRE(Endpoint::parse("tcps://example.com").value().port() == 8081);

  // Default port is left out of the Host header.
  REQUIRE(Endpoint::parse("wss://example.com").value().host_header() == "example.com");
}

TEST_CASE("Endpoint - protocol and security follow the scheme", "[endpoint]") {
  auto sse = Endpoint::parse("HTTPS://example.com/v1/stream?x=1");
  REQUIRE(sse.has_value());
  REQUIRE(sse.value().protocol() == Protocol::kSse);
  REQUIRE(sse.value().secure());
  REQUIRE(sse.value().target() == "/v1/stream?x=1");

  auto tcp = Endpoint::parse("tcp://10.0.0.5:9000");
  REQUIRE(tcp.has_value());
  REQUIRE(tcp.value().protocol() == Protocol::kTcpLines);
  REQUIRE(tcp.value().host() == "10.0.0.5");
  REQUIRE(tcp.value().port() == 9000);
}

TEST_CASE("Endpoint - query without path", "[endpoint]") {
  auto ep = Endpoint::parse("http://example.com?stream=full");
  REQUIRE(ep.has_value());
  REQUIRE(ep.value().host() == "example.com");
  REQUIRE(ep.value().target() == "/?stream=full");
}

TEST_CASE("Endpoint - stream mode selects the target", "[endpoint]") {
  EndpointOptions options;

  SECTION("WebSocket root maps to the variant path") {
    options.stream_mode = StreamMode::kFull;
    REQUIRE(Endpoint::parse("ws://localhost:8080/", options).value().target() == "/full-stream");
    options.stream_mode = StreamMode::kDomainsOnly;
    REQUIRE(Endpoint::parse("ws://localhost:8080", options).value().target() == "/domains-only");
    options.stream_mode = StreamMode::kLite;
    REQUIRE(Endpoint::parse("ws://localhost:8080/", options).value().target() == "/");
  }
  SECTION("explicit WebSocket path wins") {
    options.stream_mode = StreamMode::kFull;
    REQUIRE(Endpoint::parse("ws://localhost:8080/custom", options).value().target() == "/custom");
  }
  SECTION("SSE gets a stream query parameter") {
    options.stream_mode = StreamMode::kDomainsOnly;
    REQUIRE(Endpoint::parse("http://localhost/events", options).value().target() == "/events?stream=domains");
    options.stream_mode = StreamMode::kFull;
    REQUIRE(Endpoint::parse("http://localhost/events?since=5", options).value().target() ==
            "/events?since=5&stream=full");
    REQUIRE(Endpoint::parse("http://localhost/events?stream=lite", options).value().target() ==
            "/events?stream=lite");
  }
  SECTION("default mode leaves the target alone") {
    REQUIRE(Endpoint::parse("http://localhost/events", options).value().target() == "/events");
  }
}

TEST_CASE("Endpoint - parse_stream_mode", "[endpoint]") {
  StreamMode mode = StreamMode::kDefault;
  REQUIRE(parse_stream_mode("full", mode));
  REQUIRE(mode == StreamMode::kFull);
  REQUIRE(parse_stream_mode("domains-only", mode));
  REQUIRE(mode == StreamMode::kDomainsOnly);
  REQUIRE(parse_stream_mode("lite", mode));
  REQUIRE(mode == StreamMode::kLite);
  REQUIRE(!parse_stream_mode("everything", mode));
  REQUIRE(mode == StreamMode::kLite);
  REQUIRE(std::string(to_string(StreamMode::kDomainsOnly)) == "domains");
  REQUIRE(std::string(to_string(Protocol::kSse)) == "sse");
}

TEST_CASE("Endpoint - rejected URLs", "[endpoint]") {
  const char* bad[] = {
      "localhost:8080",            // no scheme
      "ftp://example.com/",        // unsupported scheme
      "ws://",                     // no host
      "ws://:8080/",               // empty host
      "ws://user:pw@example.com",  // credentials
      "ws://[::1]:8080/",          // IPv6 literal
      "ws://example.com:0/",       // port out of range
      "ws://example.com:65536/",   // port out of range
      "ws://example.com:80x/",     // non-numeric port
      "ws://example.com:/",        // empty port
  };
  for (const char* url : bad) {
    INFO(url);
    auto ep = Endpoint::parse(url);
    REQUIRE(!ep.has_value());
    REQUIRE(ep.get_error() == ErrorCode::kInvalidEndpoint);
  }
}

TEST_CASE("Endpoint - option bounds", "[endpoint]") {
  EndpointOptions options;

  SECTION("receive timeout above the ceiling") {
    options.receive_timeout = std::chrono::milliseconds(5001);
  }
  SECTION("zero receive timeout") {
    options.receive_timeout = std::chrono::milliseconds(0);
  }
  SECTION("zero connect timeout") {
    options.connect_timeout = std::chrono::milliseconds(0);
  }
  SECTION("message limit below the minimum") {
    options.max_message_bytes = 100;
  }

  auto ep = Endpoint::parse("ws://localhost/", options);
  REQUIRE(!ep.has_value());
  REQUIRE(ep.get_error() == ErrorCode::kInvalidEndpoint);
}

TEST_CASE("Endpoint - receive timeout at the ceiling is accepted", "[endpoint]") {
  EndpointOptions options;
  options.receive_timeout = Endpoint::kReceiveTimeoutCeiling;
  REQUIRE(Endpoint::parse("ws://localhost/", options).has_value());
}

// ============================================================================
// PoolConfig
// ============================================================================

TEST_CASE("PoolConfig - defaults are valid", "[config]") {
  PoolConfig config;
  REQUIRE(config.worker_count == 500);
  REQUIRE(config.stagger == std::chrono::milliseconds(20));
  REQUIRE(config.stats_interval == std::chrono::seconds(5));
  REQUIRE(config.backoff == std::chrono::seconds(1));
  REQUIRE(config.grace_period == std::chrono::seconds(15));
  REQUIRE(config.validate().has_value());
}

TEST_CASE("PoolConfig - grace period against a blocked connect", "[config]") {
  PoolConfig config;
  EndpointOptions options;

  // Defaults leave room for connect plus TLS and protocol handshakes.
  REQUIRE(config.grace_covers_connect(options.connect_timeout, false));
  REQUIRE(config.grace_covers_connect(options.connect_timeout, true));

  config.grace_period = std::chrono::milliseconds(5000);
  REQUIRE(!config.grace_covers_connect(std::chrono::milliseconds(5000), false));
  REQUIRE(config.grace_covers_connect(std::chrono::milliseconds(2500), false));
  REQUIRE(!config.grace_covers_connect(std::chrono::milliseconds(2500), true));

  // Only a warning: the configuration stays valid.
  REQUIRE(config.validate().has_value());
}

TEST_CASE("PoolConfig - zero workers and zero stagger are allowed", "[config]") {
  PoolConfig config;
  config.worker_count = 0;
  config.stagger = std::chrono::milliseconds(0);
  config.grace_period = std::chrono::milliseconds(0);
  REQUIRE(config.validate().has_value());
}

TEST_CASE("PoolConfig - invalid values", "[config]") {
  PoolConfig config;

  SECTION("too many workers") {
    config.worker_count = PoolConfig::kMaxWorkers + 1;
  }
  SECTION("negative stagger") {
    config.stagger = std::chrono::milliseconds(-1);
  }
  SECTION("zero stats interval") {
    config.stats_interval = std::chrono::milliseconds(0);
  }
  SECTION("zero backoff") {
    config.backoff = std::chrono::milliseconds(0);
  }
  SECTION("negative grace period") {
    config.grace_period = std::chrono::milliseconds(-5);
  }
  SECTION("zero progress step") {
    config.progress_step = 0;
  }

  auto result = config.validate();
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kInvalidConfig);
}
