#ifndef CTLOAD_CODEC_HPP_
#define CTLOAD_CODEC_HPP_

#include "endpoint.hpp"
#include "http.hpp"
#include "rx_buffer.hpp"
#include "utils.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <array>
#include <memory>
#include <random>
#include <string>
#include <string_view>

namespace ctload {

// ============================================================================
// States
// ============================================================================

enum class CodecState : uint8_t {
  kHandshaking,  // Waiting for the server's response to the opening request
  kOpen,         // Stream established, messages flowing
  kClosed        // Stream ended (close frame, terminal chunk, or local close)
};

enum class DecodeStatus : uint8_t {
  kNeedMore,    // Read more bytes from the link and call again
  kReady,       // Handshake complete
  kMessage,     // One message extracted
  kEndOfStream  // Peer finished the stream cleanly
};

// ============================================================================
// StreamCodec (turns a byte stream into opaque messages)
// ============================================================================

/**
 * @brief Framing for one streaming protocol.
 *
 * A codec never interprets message content. It holds a reference to the
 * Endpoint, which must outlive it.
 */
class StreamCodec {
 public:
  virtual ~StreamCodec() = default;

  virtual Protocol protocol() const = 0;

  // Bytes sent once the link is up (HTTP request, stream selector byte, ...).
  virtual std::string opening_request() = 0;

  // Consume the server's handshake response. Returns kNeedMore or kReady,
  // error(kHandshakeFailed) if the server refused the stream.
  virtual expected<DecodeStatus, ErrorCode> on_handshake_data(RxBuffer& rx) = 0;

  // Extract the next message into `message`. Bytes the protocol requires us
  // to answer with (pong, close echo) are appended to `reply`.
  virtual expected<DecodeStatus, ErrorCode> decode(RxBuffer& rx, std::string& message, std::string& reply) = 0;

  // The peer closed the byte stream. kEndOfStream if that is a normal end,
  // error(kConnectionClosed) otherwise.
  virtual expected<DecodeStatus, ErrorCode> on_peer_closed() = 0;

  // Bytes to send before closing locally.
  virtual std::string closing_bytes() { return {}; }

  CodecState state() const { return state_; }

 protected:
  CodecState state_ = CodecState::kHandshaking;
};

// ============================================================================
// Codec implementations
// ============================================================================

class WebSocketCodec : public StreamCodec {
 public:
  WebSocketCodec(const Endpoint& endpoint, uint32_t seed);

  Protocol protocol() const override { return Protocol::kWebSocket; }
  std::string opening_request() override;
  expected<DecodeStatus, ErrorCode> on_handshake_data(RxBuffer& rx) override;
  expected<DecodeStatus, ErrorCode> decode(RxBuffer& rx, std::string& message, std::string& reply) override;
  expected<DecodeStatus, ErrorCode> on_peer_closed() override;
  std::string closing_bytes() override;

  const std::string& client_key() const { return client_key_; }

  // Status code of the server's close frame, 0 if none (or none received).
  uint16_t close_code() const { return close_code_; }

 private:
  const Endpoint& endpoint_;
  std::mt19937 rng_;
  std::string client_key_;
  std::string fragments_;
  bool in_fragment_ = false;
  bool close_sent_ = false;
  uint16_t close_code_ = 0;

  std::array<uint8_t, 4> next_mask();
  void append_frame(std::string& out, ws::OpCode opcode, std::string_view payload);
};

class SseCodec : public StreamCodec {
 public:
  explicit SseCodec(const Endpoint& endpoint);

  Protocol protocol() const override { return Protocol::kSse; }
  std::string opening_request() override;
  expected<DecodeStatus, ErrorCode> on_handshake_data(RxBuffer& rx) override;
  expected<DecodeStatus, ErrorCode> decode(RxBuffer& rx, std::string& message, std::string& reply) override;
  expected<DecodeStatus, ErrorCode> on_peer_closed() override;

  bool chunked() const { return chunked_; }

 private:
  const Endpoint& endpoint_;
  bool chunked_ = false;
  http::ChunkedDecoder dechunker_;
  std::string body_;     // De-chunked bytes not yet split into lines
  size_t scan_pos_ = 0;  // Start of the first unprocessed line in body_
  std::string data_;     // Accumulated "data:" lines of the current event
  bool has_data_ = false;
};

class LineCodec : public StreamCodec {
 public:
  explicit LineCodec(const Endpoint& endpoint);

  Protocol protocol() const override { return Protocol::kTcpLines; }
  std::string opening_request() override;
  expected<DecodeStatus, ErrorCode> on_handshake_data(RxBuffer& rx) override;
  expected<DecodeStatus, ErrorCode> decode(RxBuffer& rx, std::string& message, std::string& reply) override;
  expected<DecodeStatus, ErrorCode> on_peer_closed() override;

 private:
  const Endpoint& endpoint_;
};

std::unique_ptr<StreamCodec> make_codec(const Endpoint& endpoint);

// Receive-buffer capacity for an endpoint: one maximal message plus framing.
size_t rx_capacity_for(const Endpoint& endpoint);

}  // namespace ctload

#endif  // CTLOAD_CODEC_HPP_
