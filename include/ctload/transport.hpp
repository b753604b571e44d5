#ifndef CTLOAD_TRANSPORT_HPP_
#define CTLOAD_TRANSPORT_HPP_

#include "codec.hpp"
#include "endpoint.hpp"
#include "link.hpp"
#include "rx_buffer.hpp"
#include "tls.hpp"
#include "vocabulary.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ctload {

// ============================================================================
// Streaming transport capability
// ============================================================================

enum class ReceiveStatus : uint8_t {
  kMessage,     // `out` holds one complete message
  kIdle,        // Timeout elapsed without a complete message
  kEndOfStream  // Peer closed the stream cleanly
};

/**
 * @brief One established streaming connection, owned by exactly one worker.
 */
class Session {
 public:
  virtual ~Session() = default;

  // Blocks for at most about `timeout` (clamped to the endpoint ceiling).
  // Any error is an abnormal closure; the session is unusable afterwards.
  virtual expected<ReceiveStatus, ErrorCode> receive(std::chrono::milliseconds timeout, std::string& out) = 0;

  // Idempotent.
  virtual void close() = 0;
};

/**
 * @brief Factory for sessions. Shared by all workers; establish() must be
 * safe to call concurrently.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  // The returned session may keep a reference to `endpoint`.
  virtual expected<std::unique_ptr<Session>, ErrorCode> establish(const Endpoint& endpoint) = 0;
};

// ============================================================================
// StreamSession (Link + StreamCodec)
// ============================================================================

class StreamSession : public Session {
 public:
  static constexpr size_t kReadChunk = 16 * 1024;

  StreamSession(const Endpoint& endpoint, std::unique_ptr<Link> link, std::unique_ptr<StreamCodec> codec);
  ~StreamSession() override;

  StreamSession(const StreamSession&) = delete;
  StreamSession& operator=(const StreamSession&) = delete;

  // Send the codec's opening request and wait for its handshake to finish,
  // bounded by the endpoint's connect timeout.
  expected<void, ErrorCode> handshake();

  expected<ReceiveStatus, ErrorCode> receive(std::chrono::milliseconds timeout, std::string& out) override;
  void close() override;

  const StreamCodec& codec() const { return *codec_; }

 private:
  // Read once into rx_. Returns bytes read (0 on timeout).
  expected<size_t, ErrorCode> fill();

  // Send whatever the codec asked us to answer with.
  expected<void, ErrorCode> flush_reply(const std::string& reply);

  const Endpoint& endpoint_;
  std::unique_ptr<Link> link_;
  std::unique_ptr<StreamCodec> codec_;
  RxBuffer rx_;
  bool ended_ = false;
};

// ============================================================================
// StreamTransport (WebSocket / SSE / TCP lines, plain or TLS)
// ============================================================================

class StreamTransport : public Transport {
 public:
  // Loads TLS trust anchors once for secure endpoints. Fails with kTlsError
  // if they cannot be loaded. Without TLS support the transport is still
  // created; secure sessions then fail with kTlsUnavailable.
  static expected<std::shared_ptr<StreamTransport>, ErrorCode> create(const Endpoint& endpoint);

  expected<std::unique_ptr<Session>, ErrorCode> establish(const Endpoint& endpoint) override;

 private:
  StreamTransport() = default;

  TlsClientContext tls_;
};

}  // namespace ctload

#endif  // CTLOAD_TRANSPORT_HPP_
