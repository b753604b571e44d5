#ifndef CTLOAD_LINK_HPP_
#define CTLOAD_LINK_HPP_

#include "endpoint.hpp"
#include "tls.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string_view>

#include <sockpp/tcp_connector.h>

namespace ctload {

// ============================================================================
// Link (blocking byte stream with bounded reads)
// ============================================================================

class Link {
 public:
  virtual ~Link() = default;

  // Blocks at most the receive timeout. Returns bytes read, 0 when the
  // timeout elapsed without data, error(kConnectionClosed) on orderly EOF.
  virtual expected<size_t, ErrorCode> read_some(uint8_t* buf, size_t len) = 0;

  virtual expected<void, ErrorCode> write_all(std::string_view data) = 0;

  // No-op if `timeout` is already in effect.
  virtual expected<void, ErrorCode> set_receive_timeout(std::chrono::milliseconds timeout) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;
};

// ============================================================================
// TcpLink (sockpp connector)
// ============================================================================

class TcpLink : public Link {
 public:
  // Resolve, connect within the endpoint's connect timeout and apply TCP tuning.
  static expected<std::unique_ptr<TcpLink>, ErrorCode> connect(const Endpoint& endpoint);

  ~TcpLink() override;

  TcpLink(const TcpLink&) = delete;
  TcpLink& operator=(const TcpLink&) = delete;

  expected<size_t, ErrorCode> read_some(uint8_t* buf, size_t len) override;
  expected<void, ErrorCode> write_all(std::string_view data) override;
  expected<void, ErrorCode> set_receive_timeout(std::chrono::milliseconds timeout) override;
  void close() override;
  bool is_open() const override { return conn_.is_open(); }

  int handle() const { return conn_.handle(); }

 private:
  explicit TcpLink(sockpp::tcp_connector&& conn);

  void apply_tuning(const TcpTuning& tuning);

  sockpp::tcp_connector conn_;
  std::chrono::milliseconds rx_timeout_{0};
};

#ifdef CTLOAD_WITH_TLS

// ============================================================================
// TlsLink (mbedTLS over a TcpLink)
// ============================================================================

class TlsLink : public Link {
 public:
  // Runs the TLS handshake, bounded by the endpoint's connect timeout.
  static expected<std::unique_ptr<TlsLink>, ErrorCode> establish(std::unique_ptr<TcpLink> tcp,
                                                                  const TlsClientContext& ctx,
                                                                  const Endpoint& endpoint);

  ~TlsLink() override;

  expected<size_t, ErrorCode> read_some(uint8_t* buf, size_t len) override;
  expected<void, ErrorCode> write_all(std::string_view data) override;
  expected<void, ErrorCode> set_receive_timeout(std::chrono::milliseconds timeout) override {
    return tcp_->set_receive_timeout(timeout);
  }
  void close() override;
  bool is_open() const override { return tcp_->is_open(); }

 private:
  explicit TlsLink(std::unique_ptr<TcpLink> tcp);

  std::unique_ptr<TcpLink> tcp_;
  TlsSession session_;
};

#endif  // CTLOAD_WITH_TLS

// Connect to the endpoint, wrapping in TLS for secure schemes.
// `tls` may be null for plain endpoints.
expected<std::unique_ptr<Link>, ErrorCode> open_link(const Endpoint& endpoint, const TlsClientContext* tls);

}  // namespace ctload

#endif  // CTLOAD_LINK_HPP_
