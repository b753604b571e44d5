#include "ctload/link.hpp"

#include "ctload/log.hpp"

#include <cerrno>
#include <cstring>

#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>

#include <exception>
#include <string>

#include <sockpp/inet_address.h>

namespace ctload {

namespace {

bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK || err == EINTR; }

}  // namespace

// ============================================================================
// TcpLink
// ============================================================================

TcpLink::TcpLink(sockpp::tcp_connector&& conn) : conn_(std::move(conn)) {}

TcpLink::~TcpLink() { close(); }

expected<std::unique_ptr<TcpLink>, ErrorCode> TcpLink::connect(const Endpoint& endpoint) {
  using Result = expected<std::unique_ptr<TcpLink>, ErrorCode>;

  sockpp::inet_address addr;
  try {
    addr = sockpp::inet_address(endpoint.host(), endpoint.port());
  } catch (const std::exception& e) {
    CTLOAD_LOG_DEBUG("Resolve " + endpoint.host() + " failed: " + e.what());
    return Result::error(ErrorCode::kResolveFailed);
  }

  sockpp::tcp_connector conn;
  if (!conn.connect(addr, endpoint.options().connect_timeout)) {
    int err = conn.last_error();
    CTLOAD_LOG_DEBUG("Connect " + addr.to_string() + " failed: " + conn.last_error_str());
    return Result::error(err == ETIMEDOUT ? ErrorCode::kTimeout : ErrorCode::kConnectFailed);
  }

  // Writes are small (handshake, pong, close) but must not hang a worker.
  if (!conn.write_timeout(endpoint.options().connect_timeout)) {
    CTLOAD_LOG_DEBUG("Set write timeout failed: " + conn.last_error_str());
    return Result::error(ErrorCode::kSocketError);
  }

  std::unique_ptr<TcpLink> link(new TcpLink(std::move(conn)));
  link->apply_tuning(endpoint.options().tcp);
  return Result::success(std::move(link));
}

void TcpLink::apply_tuning(const TcpTuning& tuning) {
  if (tuning.tcp_nodelay && !conn_.set_option(IPPROTO_TCP, TCP_NODELAY, 1)) {
    CTLOAD_LOG_DEBUG("TCP_NODELAY failed: " + conn_.last_error_str());
  }
  if (!tuning.so_keepalive) return;

  if (!conn_.set_option(SOL_SOCKET, SO_KEEPALIVE, 1)) {
    CTLOAD_LOG_DEBUG("SO_KEEPALIVE failed: " + conn_.last_error_str());
    return;
  }
#ifdef __linux__
  bool ok = conn_.set_option(IPPROTO_TCP, TCP_KEEPIDLE, tuning.keepalive_idle_s) &&
            conn_.set_option(IPPROTO_TCP, TCP_KEEPINTVL, tuning.keepalive_interval_s) &&
            conn_.set_option(IPPROTO_TCP, TCP_KEEPCNT, tuning.keepalive_count);
  if (!ok) CTLOAD_LOG_DEBUG("Keepalive parameters failed: " + conn_.last_error_str());
#endif
}

expected<size_t, ErrorCode> TcpLink::read_some(uint8_t* buf, size_t len) {
  ssize_t n = conn_.read(buf, len);
  if (n > 0) return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
  if (n == 0) return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);

  int err = conn_.last_error();
  if (would_block(err)) return expected<size_t, ErrorCode>::success(0);
  CTLOAD_LOG_DEBUG("Read error: " + conn_.last_error_str());
  return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
}

expected<void, ErrorCode> TcpLink::write_all(std::string_view data) {
  size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(conn_.handle(), data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    int err = errno;
    if (err == EINTR) continue;
    if (err == EAGAIN || err == EWOULDBLOCK) {
      CTLOAD_LOG_DEBUG("Write timed out");
      return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
    }
    CTLOAD_LOG_DEBUG("Write error: " + std::string(strerror(err)));
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

expected<void, ErrorCode> TcpLink::set_receive_timeout(std::chrono::milliseconds timeout) {
  if (timeout == rx_timeout_) return expected<void, ErrorCode>::success();
  if (!conn_.read_timeout(timeout)) {
    CTLOAD_LOG_DEBUG("Set read timeout failed: " + conn_.last_error_str());
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  rx_timeout_ = timeout;
  return expected<void, ErrorCode>::success();
}

void TcpLink::close() {
  if (conn_.is_open() && !conn_.close()) {
    CTLOAD_LOG_DEBUG("Close failed: " + conn_.last_error_str());
  }
}

#ifdef CTLOAD_WITH_TLS

// ============================================================================
// TlsLink
// ============================================================================

TlsLink::TlsLink(std::unique_ptr<TcpLink> tcp) : tcp_(std::move(tcp)) {}

TlsLink::~TlsLink() { close(); }

expected<std::unique_ptr<TlsLink>, ErrorCode> TlsLink::establish(std::unique_ptr<TcpLink> tcp,
                                                                   const TlsClientContext& ctx,
                                                                   const Endpoint& endpoint) {
  using Result = expected<std::unique_ptr<TlsLink>, ErrorCode>;
  const auto timeout = endpoint.options().connect_timeout;

  std::unique_ptr<TlsLink> link(new TlsLink(std::move(tcp)));
  int ret = link->session_.setup(ctx, link->tcp_->handle(), endpoint.host());
  if (ret != 0) {
    CTLOAD_LOG_DEBUG("TLS setup failed: " + tls_error_string(ret));
    return Result::error(ErrorCode::kTlsError);
  }

  auto timeout_set = link->tcp_->set_receive_timeout(timeout);
  if (!timeout_set) return Result::error(timeout_set.get_error());

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while ((ret = link->session_.handshake()) != 0) {
    if (ret != MBEDTLS_ERR_SSL_WANT_READ && ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
      CTLOAD_LOG_DEBUG("TLS handshake with " + endpoint.host() + " failed: " + tls_error_string(ret));
      return Result::error(ErrorCode::kTlsError);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      CTLOAD_LOG_DEBUG("TLS handshake with " + endpoint.host() + " timed out");
      return Result::error(ErrorCode::kTimeout);
    }
  }
  return Result::success(std::move(link));
}

expected<size_t, ErrorCode> TlsLink::read_some(uint8_t* buf, size_t len) {
  while (true) {
    int ret = session_.read(buf, len);
    if (ret > 0) return expected<size_t, ErrorCode>::success(static_cast<size_t>(ret));
    if (ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
      return expected<size_t, ErrorCode>::success(0);
    }
#ifdef MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET
    if (ret == MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET) continue;
#endif
    CTLOAD_LOG_DEBUG("TLS read error: " + tls_error_string(ret));
    return expected<size_t, ErrorCode>::error(ret == MBEDTLS_ERR_NET_CONN_RESET ? ErrorCode::kSocketError
                                                                               : ErrorCode::kTlsError);
  }
}

expected<void, ErrorCode> TlsLink::write_all(std::string_view data) {
  size_t sent = 0;
  while (sent < data.size()) {
    int ret = session_.write(reinterpret_cast<const uint8_t*>(data.data()) + sent, data.size() - sent);
    if (ret > 0) {
      sent += static_cast<size_t>(ret);
      continue;
    }
    if (ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
      CTLOAD_LOG_DEBUG("TLS write timed out");
      return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
    }
    if (ret == MBEDTLS_ERR_SSL_WANT_READ) continue;
    CTLOAD_LOG_DEBUG("TLS write error: " + tls_error_string(ret));
    return expected<void, ErrorCode>::error(ErrorCode::kTlsError);
  }
  return expected<void, ErrorCode>::success();
}

void TlsLink::close() {
  if (!tcp_->is_open()) return;
  int ret = session_.close_notify();
  if (ret != 0 && ret != MBEDTLS_ERR_SSL_WANT_WRITE) {
    CTLOAD_LOG_DEBUG("TLS close_notify failed: " + tls_error_string(ret));
  }
  tcp_->close();
}

#endif  // CTLOAD_WITH_TLS

// ============================================================================
// open_link
// ============================================================================

expected<std::unique_ptr<Link>, ErrorCode> open_link(const Endpoint& endpoint, const TlsClientContext* tls) {
  using Result = expected<std::unique_ptr<Link>, ErrorCode>;

#ifndef CTLOAD_WITH_TLS
  if (endpoint.secure()) return Result::error(ErrorCode::kTlsUnavailable);
#endif

  auto tcp = TcpLink::connect(endpoint);
  if (!tcp) return Result::error(tcp.get_error());

  if (!endpoint.secure()) return Result::success(std::unique_ptr<Link>(std::move(tcp.value())));

#ifdef CTLOAD_WITH_TLS
  if (tls == nullptr || !tls->is_initialized()) return Result::error(ErrorCode::kTlsError);
  auto secured = TlsLink::establish(std::move(tcp.value()), *tls, endpoint);
  if (!secured) return Result::error(secured.get_error());
  return Result::success(std::unique_ptr<Link>(std::move(secured.value())));
#else
  (void)tls;
  return Result::error(ErrorCode::kTlsUnavailable);
#endif
}

}  // namespace ctload
