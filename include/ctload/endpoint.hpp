#ifndef CTLOAD_ENDPOINT_HPP_
#define CTLOAD_ENDPOINT_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <chrono>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctload {

// ============================================================================
// Endpoint configuration
// ============================================================================

enum class Scheme : uint8_t { kWs, kWss, kHttp, kHttps, kTcp, kTcps };

// Stream framing spoken over the connection.
enum class Protocol : uint8_t {
  kWebSocket,  // RFC 6455 text/binary messages
  kSse,        // text/event-stream, one message per event
  kTcpLines    // newline-delimited JSON
};

// Which variant of the certificate stream to request.
enum class StreamMode : uint8_t { kDefault, kFull, kLite, kDomainsOnly };

const char* to_string(Protocol protocol);
const char* to_string(StreamMode mode);
bool parse_stream_mode(std::string_view text, StreamMode& out);

struct TcpTuning {
  bool tcp_nodelay = true;     // Disable Nagle algorithm
  bool so_keepalive = false;   // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;
  int keepalive_interval_s = 10;
  int keepalive_count = 5;
};

struct TlsOptions {
  bool verify_peer = true;
  std::string ca_file;  // PEM bundle; empty = system store
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct EndpointOptions {
  std::chrono::milliseconds connect_timeout{5000};
  std::chrono::milliseconds receive_timeout{1000};
  HeaderList headers;
  size_t max_message_bytes = 1024 * 1024;
  StreamMode stream_mode = StreamMode::kDefault;
  TcpTuning tcp;
  TlsOptions tls;
};

/**
 * @brief Immutable target of the load run.
 *
 * Built once from a URL by parse(); every worker reads the same instance.
 * Accepted forms: ws://, wss://, http://, https://, tcp://, tcps://
 * followed by host[:port][/path][?query].
 */
class Endpoint {
 public:
  // Upper bound on a single blocking receive. Shutdown latency depends on it.
  static constexpr std::chrono::milliseconds kReceiveTimeoutCeiling{5000};
  static constexpr size_t kMinMessageBytes = 1024;

  static expected<Endpoint, ErrorCode> parse(std::string_view url, const EndpointOptions& options = EndpointOptions());

  const std::string& url() const { return url_; }
  Scheme scheme() const { return scheme_; }
  Protocol protocol() const;
  bool secure() const;
  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

  // Request target (path and query) after stream-mode adjustments.
  const std::string& target() const { return target_; }

  // Value for the HTTP Host header.
  std::string host_header() const;

  const EndpointOptions& options() const { return options_; }

 private:
  Endpoint(std::string url, Scheme scheme, std::string host, uint16_t port, std::string target,
           EndpointOptions options);

  std::string url_;
  Scheme scheme_;
  std::string host_;
  uint16_t port_;
  std::string target_;
  EndpointOptions options_;
};

}  // namespace ctload

#endif  // CTLOAD_ENDPOINT_HPP_
