#include "ctload/endpoint.hpp"

#include "ctload/log.hpp"

#include <cctype>
#include <cstdlib>

namespace ctload {

namespace {

constexpr uint16_t kDefaultTcpStreamPort = 8081;

bool scheme_from_string(std::string_view text, Scheme& out) {
  std::string lower(text);
  for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "ws") {
    out = Scheme::kWs;
  } else if (lower == "wss") {
    out = Scheme::kWss;
  } else if (lower == "http") {
    out = Scheme::kHttp;
  } else if (lower == "https") {
    out = Scheme::kHttps;
  } else if (lower == "tcp") {
    out = Scheme::kTcp;
  } else if (lower == "tcps") {
    out = Scheme::kTcps;
  } else {
    return false;
  }
  return true;
}

uint16_t default_port(Scheme scheme) {
  switch (scheme) {
    case Scheme::kWs:
    case Scheme::kHttp:
      return 80;
    case Scheme::kWss:
    case Scheme::kHttps:
      return 443;
    case Scheme::kTcp:
    case Scheme::kTcps:
      return kDefaultTcpStreamPort;
  }
  return 80;
}

// The certificate stream serves its variants on fixed WebSocket paths and
// through the `stream` query parameter for SSE.
std::string apply_stream_mode(Protocol protocol, StreamMode mode, std::string target) {
  if (mode == StreamMode::kDefault) return target;

  if (protocol == Protocol::kWebSocket) {
    if (target != "/") return target;
    switch (mode) {
      case StreamMode::kFull: return "/full-stream";
      case StreamMode::kDomainsOnly: return "/domains-only";
      default: return target;
    }
  }

  if (protocol == Protocol::kSse) {
    if (target.find("stream=") != std::string::npos) return target;
    const char* value = mode == StreamMode::kFull ? "full" : mode == StreamMode::kDomainsOnly ? "domains" : "lite";
    target += (target.find('?') == std::string::npos) ? "?" : "&";
    target += "stream=";
    target += value;
  }
  return target;
}

}  // namespace

const char* to_string(Protocol protocol) {
  switch (protocol) {
    case Protocol::kWebSocket: return "websocket";
    case Protocol::kSse: return "sse";
    case Protocol::kTcpLines: return "tcp";
  }
  return "unknown";
}

const char* to_string(StreamMode mode) {
  switch (mode) {
    case StreamMode::kDefault: return "default";
    case StreamMode::kFull: return "full";
    case StreamMode::kLite: return "lite";
    case StreamMode::kDomainsOnly: return "domains";
  }
  return "unknown";
}

bool parse_stream_mode(std::string_view text, StreamMode& out) {
  if (text == "full") {
    out = StreamMode::kFull;
  } else if (text == "lite") {
    out = StreamMode::kLite;
  } else if (text == "domains" || text == "domains-only") {
    out = StreamMode::kDomainsOnly;
  } else if (text == "default") {
    out = StreamMode::kDefault;
  } else {
    return false;
  }
  return true;
}

Endpoint::Endpoint(std::string url, Scheme scheme, std::string host, uint16_t port, std::string target,
                   EndpointOptions options)
    : url_(std::move(url)),
      scheme_(scheme),
      host_(std::move(host)),
      port_(port),
      target_(std::move(target)),
      options_(std::move(options)) {}

expected<Endpoint, ErrorCode> Endpoint::parse(std::string_view url, const EndpointOptions& options) {
  auto invalid = [&url](const char* why) {
    CTLOAD_LOG_ERROR("Invalid endpoint '" + std::string(url) + "': " + why);
    return expected<Endpoint, ErrorCode>::error(ErrorCode::kInvalidEndpoint);
  };

  size_t sep = url.find("://");
  if (sep == std::string_view::npos) return invalid("missing scheme");

  Scheme scheme;
  if (!scheme_from_string(url.substr(0, sep), scheme)) return invalid("unsupported scheme");

  std::string_view rest = url.substr(sep + 3);
  size_t target_pos = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, target_pos);
  std::string target = target_pos == std::string_view::npos ? "/" : std::string(rest.substr(target_pos));
  if (target.front() == '?') target.insert(target.begin(), '/');

  if (authority.empty()) return invalid("missing host");
  if (authority.find('@') != std::string_view::npos) return invalid("credentials are not supported");
  if (authority.front() == '[') return invalid("IPv6 literals are not supported");

  std::string host;
  uint16_t port = default_port(scheme);
  size_t colon = authority.rfind(':');
  if (colon == std::string_view::npos) {
    host = std::string(authority);
  } else {
    host = std::string(authority.substr(0, colon));
    std::string port_text(authority.substr(colon + 1));
    if (port_text.empty() || port_text.size() > 5) return invalid("bad port");
    for (char c : port_text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) return invalid("bad port");
    }
    long value = std::strtol(port_text.c_str(), nullptr, 10);
    if (value <= 0 || value > 65535) return invalid("port out of range");
    port = static_cast<uint16_t>(value);
  }
  if (host.empty()) return invalid("missing host");

  if (options.connect_timeout.count() <= 0) return invalid("connect timeout must be positive");
  if (options.receive_timeout.count() <= 0 || options.receive_timeout > kReceiveTimeoutCeiling) {
    return invalid("receive timeout must be within (0, 5000] ms");
  }
  if (options.max_message_bytes < kMinMessageBytes) return invalid("max message size too small");

  Endpoint endpoint(std::string(url), scheme, std::move(host), port, std::move(target), options);
  endpoint.target_ = apply_stream_mode(endpoint.protocol(), options.stream_mode, std::move(endpoint.target_));
  return expected<Endpoint, ErrorCode>::success(std::move(endpoint));
}

Protocol Endpoint::protocol() const {
  switch (scheme_) {
    case Scheme::kWs:
    case Scheme::kWss:
      return Protocol::kWebSocket;
    case Scheme::kHttp:
    case Scheme::kHttps:
      return Protocol::kSse;
    case Scheme::kTcp:
    case Scheme::kTcps:
      return Protocol::kTcpLines;
  }
  return Protocol::kWebSocket;
}

bool Endpoint::secure() const {
  return scheme_ == Scheme::kWss || scheme_ == Scheme::kHttps || scheme_ == Scheme::kTcps;
}

std::string Endpoint::host_header() const {
  if (port_ == default_port(scheme_)) return host_;
  return host_ + ":" + std::to_string(port_);
}

}  // namespace ctload
