#include "ctload/transport.hpp"

#include "ctload/log.hpp"

#include <algorithm>

namespace ctload {

// ============================================================================
// StreamSession
// ============================================================================

StreamSession::StreamSession(const Endpoint& endpoint, std::unique_ptr<Link> link, std::unique_ptr<StreamCodec> codec)
    : endpoint_(endpoint), link_(std::move(link)), codec_(std::move(codec)), rx_(rx_capacity_for(endpoint)) {}

StreamSession::~StreamSession() { close(); }

expected<void, ErrorCode> StreamSession::handshake() {
  const auto timeout = endpoint_.options().connect_timeout;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  auto timeout_set = link_->set_receive_timeout(timeout);
  if (!timeout_set) return timeout_set;

  std::string request = codec_->opening_request();
  if (!request.empty()) {
    auto sent = link_->write_all(request);
    if (!sent) return sent;
  }

  while (true) {
    auto status = codec_->on_handshake_data(rx_);
    if (!status) return expected<void, ErrorCode>::error(status.get_error());
    if (status.value() == DecodeStatus::kReady) return expected<void, ErrorCode>::success();

    if (std::chrono::steady_clock::now() >= deadline) {
      CTLOAD_LOG_DEBUG(std::string("Handshake timed out (") + to_string(codec_->protocol()) + ")");
      return expected<void, ErrorCode>::error(ErrorCode::kTimeout);
    }
    auto n = fill();
    if (!n) {
      // Closing before answering is a refused stream, not a dropped one.
      ErrorCode err = n.get_error() == ErrorCode::kConnectionClosed ? ErrorCode::kHandshakeFailed : n.get_error();
      return expected<void, ErrorCode>::error(err);
    }
  }
}

expected<ReceiveStatus, ErrorCode> StreamSession::receive(std::chrono::milliseconds timeout, std::string& out) {
  using Result = expected<ReceiveStatus, ErrorCode>;
  if (ended_) return Result::success(ReceiveStatus::kEndOfStream);
  if (!link_->is_open()) return Result::error(ErrorCode::kInvalidState);

  timeout = std::min(timeout, Endpoint::kReceiveTimeoutCeiling);
  auto timeout_set = link_->set_receive_timeout(timeout);
  if (!timeout_set) return Result::error(timeout_set.get_error());

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    std::string reply;
    auto status = codec_->decode(rx_, out, reply);
    if (!reply.empty()) {
      auto sent = flush_reply(reply);
      if (!sent) return Result::error(sent.get_error());
    }
    if (!status) return Result::error(status.get_error());

    switch (status.value()) {
      case DecodeStatus::kMessage:
        return Result::success(ReceiveStatus::kMessage);
      case DecodeStatus::kEndOfStream:
        ended_ = true;
        return Result::success(ReceiveStatus::kEndOfStream);
      case DecodeStatus::kNeedMore:
      case DecodeStatus::kReady:
        break;
    }
    if (std::chrono::steady_clock::now() >= deadline) return Result::success(ReceiveStatus::kIdle);

    auto n = fill();
    if (!n) {
      if (n.get_error() != ErrorCode::kConnectionClosed) return Result::error(n.get_error());
      auto closed = codec_->on_peer_closed();
      if (!closed) return Result::error(closed.get_error());
      ended_ = true;
      return Result::success(ReceiveStatus::kEndOfStream);
    }
    if (n.value() == 0) return Result::success(ReceiveStatus::kIdle);
  }
}

void StreamSession::close() {
  if (!link_ || !link_->is_open()) return;
  std::string bye = codec_->closing_bytes();
  if (!bye.empty()) {
    auto sent = link_->write_all(bye);
    if (!sent) CTLOAD_LOG_DEBUG(std::string("Close handshake not sent: ") + to_string(sent.get_error()));
  }
  link_->close();
}

expected<size_t, ErrorCode> StreamSession::fill() {
  size_t room = rx_.prepare(kReadChunk);
  if (room == 0) return expected<size_t, ErrorCode>::error(ErrorCode::kBufferFull);
  auto n = link_->read_some(rx_.write_ptr(), room);
  if (n && n.value() > 0) rx_.commit(n.value());
  return n;
}

expected<void, ErrorCode> StreamSession::flush_reply(const std::string& reply) { return link_->write_all(reply); }

// ============================================================================
// StreamTransport
// ============================================================================

expected<std::shared_ptr<StreamTransport>, ErrorCode> StreamTransport::create(const Endpoint& endpoint) {
  using Result = expected<std::shared_ptr<StreamTransport>, ErrorCode>;
  std::shared_ptr<StreamTransport> transport(new StreamTransport());

#ifdef CTLOAD_WITH_TLS
  if (endpoint.secure()) {
    int ret = transport->tls_.init(endpoint.options().tls);
    if (ret != 0) {
      CTLOAD_LOG_ERROR("Cannot load TLS trust anchors: " + tls_error_string(ret));
      return Result::error(ErrorCode::kTlsError);
    }
  }
#else
  if (endpoint.secure()) {
    CTLOAD_LOG_WARN("Built without TLS support; every connection to " + endpoint.url() + " will fail");
  }
#endif
  return Result::success(std::move(transport));
}

expected<std::unique_ptr<Session>, ErrorCode> StreamTransport::establish(const Endpoint& endpoint) {
  using Result = expected<std::unique_ptr<Session>, ErrorCode>;

  auto link = open_link(endpoint, &tls_);
  if (!link) return Result::error(link.get_error());

  auto session = std::make_unique<StreamSession>(endpoint, std::move(link.value()), make_codec(endpoint));
  auto ready = session->handshake();
  if (!ready) return Result::error(ready.get_error());
  return Result::success(std::unique_ptr<Session>(std::move(session)));
}

}  // namespace ctload
