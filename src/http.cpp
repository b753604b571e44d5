#include "ctload/http.hpp"

#include <cctype>

#include <algorithm>

namespace ctload {
namespace http {

namespace {

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string_view ResponseHead::header(std::string_view name) const {
  for (const auto& h : headers) {
    if (iequals(h.first, name)) return h.second;
  }
  return {};
}

bool ResponseHead::header_has_token(std::string_view name, std::string_view token) const {
  std::string_view value = header(name);
  while (!value.empty()) {
    size_t comma = value.find(',');
    std::string_view item = trim(value.substr(0, comma));
    if (iequals(item, token)) return true;
    if (comma == std::string_view::npos) break;
    value.remove_prefix(comma + 1);
  }
  return false;
}

expected<size_t, ErrorCode> parse_response_head(std::string_view data, ResponseHead& head) {
  size_t end = data.find("\r\n\r\n");
  if (end == std::string_view::npos) {
    if (data.size() > kMaxHeadSize) return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    return expected<size_t, ErrorCode>::success(0);
  }
  if (end + 4 > kMaxHeadSize) return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);

  std::string_view block = data.substr(0, end);
  size_t line_end = block.find("\r\n");
  std::string_view status_line = block.substr(0, line_end);

  // "HTTP/1.1 101 Switching Protocols"
  if (status_line.substr(0, 5) != "HTTP/") return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  size_t sp = status_line.find(' ');
  if (sp == std::string_view::npos || status_line.size() < sp + 4) {
    return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  }
  int status = 0;
  for (size_t i = sp + 1; i < sp + 4; ++i) {
    char c = status_line[i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    status = status * 10 + (c - '0');
  }
  head.status = status;
  head.reason = std::string(trim(status_line.size() > sp + 4 ? status_line.substr(sp + 4) : std::string_view()));
  head.headers.clear();

  std::string_view rest = line_end == std::string_view::npos ? std::string_view() : block.substr(line_end + 2);
  while (!rest.empty()) {
    size_t eol = rest.find("\r\n");
    std::string_view line = rest.substr(0, eol);
    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kHandshakeFailed);
    }
    head.headers.emplace_back(std::string(trim(line.substr(0, colon))), std::string(trim(line.substr(colon + 1))));
    if (eol == std::string_view::npos) break;
    rest.remove_prefix(eol + 2);
  }
  return expected<size_t, ErrorCode>::success(end + 4);
}

expected<size_t, ErrorCode> ChunkedDecoder::feed(std::string_view in, std::string& out) {
  size_t pos = 0;
  while (pos < in.size() && state_ != State::kDone) {
    std::string_view avail = in.substr(pos);
    switch (state_) {
      case State::kSize: {
        size_t eol = avail.find("\r\n");
        if (eol == std::string_view::npos) {
          if (avail.size() > kMaxLineSize) return expected<size_t, ErrorCode>::error(ErrorCode::kFrameParseError);
          return expected<size_t, ErrorCode>::success(pos);
        }
        std::string_view line = avail.substr(0, eol);
        size_t ext = line.find(';');
        std::string_view digits = trim(line.substr(0, ext));
        if (digits.empty() || digits.size() > 15) return expected<size_t, ErrorCode>::error(ErrorCode::kFrameParseError);
        uint64_t size = 0;
        for (char c : digits) {
          int v = hex_value(c);
          if (v < 0) return expected<size_t, ErrorCode>::error(ErrorCode::kFrameParseError);
          size = (size << 4) | static_cast<uint64_t>(v);
        }
        pos += eol + 2;
        remaining_ = size;
        state_ = size == 0 ? State::kTrailer : State::kData;
        break;
      }
      case State::kData: {
        size_t take = static_cast<size_t>(std::min<uint64_t>(remaining_, avail.size()));
        out.append(avail.data(), take);
        pos += take;
        remaining_ -= take;
        if (remaining_ == 0) state_ = State::kDataEnd;
        break;
      }
      case State::kDataEnd: {
        if (avail.size() < 2) return expected<size_t, ErrorCode>::success(pos);
        if (avail[0] != '\r' || avail[1] != '\n') return expected<size_t, ErrorCode>::error(ErrorCode::kFrameParseError);
        pos += 2;
        state_ = State::kSize;
        break;
      }
      case State::kTrailer: {
        size_t eol = avail.find("\r\n");
        if (eol == std::string_view::npos) {
          if (avail.size() > kMaxLineSize) return expected<size_t, ErrorCode>::error(ErrorCode::kFrameParseError);
          return expected<size_t, ErrorCode>::success(pos);
        }
        pos += eol + 2;
        if (eol == 0) state_ = State::kDone;
        break;
      }
      case State::kDone:
        break;
    }
  }
  return expected<size_t, ErrorCode>::success(pos);
}

}  // namespace http
}  // namespace ctload
