#include "ctload/codec.hpp"

#include "ctload/log.hpp"

#include <algorithm>

namespace ctload {

namespace {

using DecodeResult = expected<DecodeStatus, ErrorCode>;

DecodeResult status(DecodeStatus s) { return DecodeResult::success(s); }
DecodeResult failure(ErrorCode e) { return DecodeResult::error(e); }

constexpr size_t kMaxFrameOverhead = 14;
constexpr size_t kMaxControlPayload = 125;
constexpr uint16_t kCloseNormal = 1000;

void append_common_headers(std::string& req, const Endpoint& endpoint) {
  req += "Host: ";
  req += endpoint.host_header();
  req += "\r\nUser-Agent: ctload\r\n";
  for (const auto& h : endpoint.options().headers) {
    req += h.first;
    req += ": ";
    req += h.second;
    req += "\r\n";
  }
}

}  // namespace

// ============================================================================
// WebSocketCodec
// ============================================================================

WebSocketCodec::WebSocketCodec(const Endpoint& endpoint, uint32_t seed) : endpoint_(endpoint), rng_(seed) {
  std::array<uint8_t, 16> nonce;
  for (auto& b : nonce) b = static_cast<uint8_t>(rng_() & 0xFF);
  client_key_ = Base64::encode(nonce.data(), nonce.size());
}

std::string WebSocketCodec::opening_request() {
  std::string req = "GET " + endpoint_.target() + " HTTP/1.1\r\n";
  append_common_headers(req, endpoint_);
  req += "Upgrade: websocket\r\n"
         "Connection: Upgrade\r\n"
         "Sec-WebSocket-Version: 13\r\n"
         "Sec-WebSocket-Key: ";
  req += client_key_;
  req += "\r\n\r\n";
  return req;
}

DecodeResult WebSocketCodec::on_handshake_data(RxBuffer& rx) {
  http::ResponseHead head;
  auto parsed = http::parse_response_head(rx.view(), head);
  if (!parsed) return failure(parsed.get_error());
  if (parsed.value() == 0) return status(DecodeStatus::kNeedMore);

  if (head.status != 101) {
    CTLOAD_LOG_DEBUG("WebSocket upgrade refused: HTTP " + std::to_string(head.status) + " " + head.reason);
    return failure(ErrorCode::kHandshakeFailed);
  }
  if (!http::iequals(head.header("Upgrade"), "websocket") || !head.header_has_token("Connection", "upgrade")) {
    CTLOAD_LOG_DEBUG("WebSocket upgrade response missing Upgrade/Connection headers");
    return failure(ErrorCode::kHandshakeFailed);
  }
  if (head.header("Sec-WebSocket-Accept") != ws::accept_key(client_key_)) {
    CTLOAD_LOG_DEBUG("WebSocket upgrade response has wrong Sec-WebSocket-Accept");
    return failure(ErrorCode::kHandshakeFailed);
  }

  // Frames may follow the head in the same read; they stay in rx.
  rx.advance(parsed.value());
  state_ = CodecState::kOpen;
  return status(DecodeStatus::kReady);
}

DecodeResult WebSocketCodec::decode(RxBuffer& rx, std::string& message, std::string& reply) {
  const size_t max_message = endpoint_.options().max_message_bytes;

  while (state_ == CodecState::kOpen) {
    std::string_view data = rx.view();
    ws::FrameHeader header;
    size_t header_size = ws::parse_frame_header(data, header);
    if (header_size == 0) return status(DecodeStatus::kNeedMore);

    if (header.rsv != 0) return failure(ErrorCode::kFrameParseError);
    if (ws::is_control(header.opcode) && (!header.fin || header.payload_len > kMaxControlPayload)) {
      return failure(ErrorCode::kFrameParseError);
    }
    if (header.payload_len > max_message) return failure(ErrorCode::kBufferFull);

    size_t total = header_size + static_cast<size_t>(header.payload_len);
    if (data.size() < total) return status(DecodeStatus::kNeedMore);

    std::string payload(data.substr(header_size, static_cast<size_t>(header.payload_len)));
    rx.advance(total);
    if (header.masked) {
      ws::apply_mask(reinterpret_cast<uint8_t*>(&payload[0]), payload.size(), header.mask_key);
    }

    switch (header.opcode) {
      case ws::OpCode::kText:
      case ws::OpCode::kBinary:
        if (in_fragment_) return failure(ErrorCode::kFrameParseError);
        if (header.fin) {
          message.swap(payload);
          return status(DecodeStatus::kMessage);
        }
        fragments_.swap(payload);
        in_fragment_ = true;
        break;

      case ws::OpCode::kContinuation:
        if (!in_fragment_) return failure(ErrorCode::kFrameParseError);
        if (fragments_.size() + payload.size() > max_message) return failure(ErrorCode::kBufferFull);
        fragments_ += payload;
        if (header.fin) {
          in_fragment_ = false;
          message.swap(fragments_);
          fragments_.clear();
          return status(DecodeStatus::kMessage);
        }
        break;

      case ws::OpCode::kPing:
        append_frame(reply, ws::OpCode::kPong, payload);
        break;

      case ws::OpCode::kPong:
        break;

      case ws::OpCode::kClose: {
        if (payload.size() >= 2) {
          close_code_ = static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
        }
        if (!close_sent_) {
          append_frame(reply, ws::OpCode::kClose, payload.substr(0, std::min<size_t>(payload.size(), 2)));
          close_sent_ = true;
        }
        state_ = CodecState::kClosed;
        return status(DecodeStatus::kEndOfStream);
      }

      default:
        return failure(ErrorCode::kFrameParseError);
    }
  }
  return status(DecodeStatus::kEndOfStream);
}

DecodeResult WebSocketCodec::on_peer_closed() {
  if (state_ == CodecState::kClosed) return status(DecodeStatus::kEndOfStream);
  state_ = CodecState::kClosed;
  return failure(ErrorCode::kConnectionClosed);
}

std::string WebSocketCodec::closing_bytes() {
  std::string out;
  if (state_ == CodecState::kOpen && !close_sent_) {
    const char code[2] = {static_cast<char>(kCloseNormal >> 8), static_cast<char>(kCloseNormal & 0xFF)};
    append_frame(out, ws::OpCode::kClose, std::string_view(code, 2));
    close_sent_ = true;
  }
  state_ = CodecState::kClosed;
  return out;
}

std::array<uint8_t, 4> WebSocketCodec::next_mask() {
  uint32_t r = rng_();
  return {static_cast<uint8_t>(r >> 24), static_cast<uint8_t>(r >> 16), static_cast<uint8_t>(r >> 8),
          static_cast<uint8_t>(r)};
}

void WebSocketCodec::append_frame(std::string& out, ws::OpCode opcode, std::string_view payload) {
  auto mask = next_mask();
  auto frame = ws::encode_frame(opcode, payload, &mask);
  out.append(reinterpret_cast<const char*>(frame.data()), frame.size());
}

// ============================================================================
// SseCodec
// ============================================================================

SseCodec::SseCodec(const Endpoint& endpoint) : endpoint_(endpoint) {}

std::string SseCodec::opening_request() {
  std::string req = "GET " + endpoint_.target() + " HTTP/1.1\r\n";
  append_common_headers(req, endpoint_);
  req += "Accept: text/event-stream\r\n"
         "Cache-Control: no-cache\r\n"
         "Connection: keep-alive\r\n"
         "\r\n";
  return req;
}

DecodeResult SseCodec::on_handshake_data(RxBuffer& rx) {
  http::ResponseHead head;
  auto parsed = http::parse_response_head(rx.view(), head);
  if (!parsed) return failure(parsed.get_error());
  if (parsed.value() == 0) return status(DecodeStatus::kNeedMore);

  if (head.status != 200) {
    CTLOAD_LOG_DEBUG("SSE request refused: HTTP " + std::to_string(head.status) + " " + head.reason);
    return failure(ErrorCode::kHandshakeFailed);
  }
  std::string_view content_type = head.header("Content-Type");
  if (content_type.substr(0, 17) != "text/event-stream") {
    CTLOAD_LOG_DEBUG("SSE response has Content-Type '" + std::string(content_type) + "'");
  }
  chunked_ = head.header_has_token("Transfer-Encoding", "chunked");

  rx.advance(parsed.value());
  state_ = CodecState::kOpen;
  return status(DecodeStatus::kReady);
}

DecodeResult SseCodec::decode(RxBuffer& rx, std::string& message, std::string& /* reply */) {
  const size_t max_message = endpoint_.options().max_message_bytes;
  if (state_ == CodecState::kClosed) return status(DecodeStatus::kEndOfStream);

  if (!rx.empty()) {
    if (chunked_) {
      auto used = dechunker_.feed(rx.view(), body_);
      if (!used) return failure(used.get_error());
      rx.advance(used.value());
    } else {
      body_.append(rx.view().data(), rx.size());
      rx.advance(rx.size());
    }
  }

  auto compact = [this]() {
    body_.erase(0, scan_pos_);
    scan_pos_ = 0;
  };

  while (true) {
    size_t eol = body_.find('\n', scan_pos_);
    if (eol == std::string::npos) break;

    std::string_view line(body_.data() + scan_pos_, eol - scan_pos_);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    scan_pos_ = eol + 1;

    if (line.empty()) {
      bool dispatch = has_data_ && !data_.empty();
      has_data_ = false;
      if (dispatch) {
        message.swap(data_);
        data_.clear();
        compact();
        return status(DecodeStatus::kMessage);
      }
      data_.clear();
      continue;
    }
    if (line.front() == ':') continue;  // comment / keep-alive

    size_t colon = line.find(':');
    std::string_view field = line.substr(0, colon);
    std::string_view value = colon == std::string_view::npos ? std::string_view() : line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') value.remove_prefix(1);

    if (field == "data") {
      if (has_data_) data_ += '\n';
      data_.append(value.data(), value.size());
      has_data_ = true;
      if (data_.size() > max_message) return failure(ErrorCode::kBufferFull);
    }
    // "event", "id" and "retry" carry nothing the harness counts.
  }

  compact();
  if (body_.size() > max_message) return failure(ErrorCode::kBufferFull);
  if (chunked_ && dechunker_.done()) {
    state_ = CodecState::kClosed;
    return status(DecodeStatus::kEndOfStream);
  }
  return status(DecodeStatus::kNeedMore);
}

DecodeResult SseCodec::on_peer_closed() {
  bool clean = state_ == CodecState::kClosed || !chunked_;
  state_ = CodecState::kClosed;
  if (clean) return status(DecodeStatus::kEndOfStream);
  return failure(ErrorCode::kConnectionClosed);
}

// ============================================================================
// LineCodec
// ============================================================================

LineCodec::LineCodec(const Endpoint& endpoint) : endpoint_(endpoint) {}

std::string LineCodec::opening_request() {
  // The TCP stream reads one selector byte: 'f'ull, 'd'omains, anything else lite.
  switch (endpoint_.options().stream_mode) {
    case StreamMode::kFull: return "f";
    case StreamMode::kLite: return "l";
    case StreamMode::kDomainsOnly: return "d";
    case StreamMode::kDefault: break;
  }
  return {};
}

DecodeResult LineCodec::on_handshake_data(RxBuffer& /* rx */) {
  state_ = CodecState::kOpen;
  return status(DecodeStatus::kReady);
}

DecodeResult LineCodec::decode(RxBuffer& rx, std::string& message, std::string& /* reply */) {
  if (state_ == CodecState::kClosed) return status(DecodeStatus::kEndOfStream);

  while (true) {
    std::string_view data = rx.view();
    size_t eol = data.find('\n');
    if (eol == std::string_view::npos) {
      if (rx.size() > endpoint_.options().max_message_bytes) return failure(ErrorCode::kBufferFull);
      return status(DecodeStatus::kNeedMore);
    }

    std::string_view line = data.substr(0, eol);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    bool blank = line.find_first_not_of(" \t") == std::string_view::npos;
    if (!blank) message.assign(line.data(), line.size());
    rx.advance(eol + 1);
    if (!blank) return status(DecodeStatus::kMessage);
  }
}

DecodeResult LineCodec::on_peer_closed() {
  state_ = CodecState::kClosed;
  return status(DecodeStatus::kEndOfStream);
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<StreamCodec> make_codec(const Endpoint& endpoint) {
  switch (endpoint.protocol()) {
    case Protocol::kWebSocket: {
      std::random_device rd;
      return std::make_unique<WebSocketCodec>(endpoint, rd());
    }
    case Protocol::kSse:
      return std::make_unique<SseCodec>(endpoint);
    case Protocol::kTcpLines:
      return std::make_unique<LineCodec>(endpoint);
  }
  return nullptr;
}

size_t rx_capacity_for(const Endpoint& endpoint) {
  return endpoint.options().max_message_bytes + http::kMaxHeadSize + kMaxFrameOverhead;
}

}  // namespace ctload
