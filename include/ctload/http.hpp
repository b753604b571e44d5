#ifndef CTLOAD_HTTP_HPP_
#define CTLOAD_HTTP_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ctload {
namespace http {

// Hard limit on a response head; a server that sends more is not speaking
// the protocol we asked for.
static constexpr size_t kMaxHeadSize = 16 * 1024;

struct ResponseHead {
  int status = 0;
  std::string reason;
  std::vector<std::pair<std::string, std::string>> headers;

  // Case-insensitive header lookup. Returns empty view if absent.
  std::string_view header(std::string_view name) const;

  // True if the comma-separated header value contains `token` (case-insensitive).
  bool header_has_token(std::string_view name, std::string_view token) const;
};

// Parses "HTTP/1.x <status> <reason>\r\n<headers>\r\n\r\n" from the start of `data`.
// Returns the number of bytes in the head, 0 if incomplete, or
// error(kHandshakeFailed) if malformed or larger than kMaxHeadSize.
expected<size_t, ErrorCode> parse_response_head(std::string_view data, ResponseHead& head);

bool iequals(std::string_view a, std::string_view b);

// ============================================================================
// ChunkedDecoder (Transfer-Encoding: chunked)
// ============================================================================

class ChunkedDecoder {
 public:
  // Decodes as much of `in` as possible, appending body bytes to `out`.
  // Returns bytes consumed from `in`; the caller advances its buffer.
  expected<size_t, ErrorCode> feed(std::string_view in, std::string& out);

  // Terminal chunk and trailers have been consumed.
  bool done() const { return state_ == State::kDone; }

 private:
  enum class State { kSize, kData, kDataEnd, kTrailer, kDone };

  static constexpr size_t kMaxLineSize = 4096;

  State state_ = State::kSize;
  uint64_t remaining_ = 0;
};

}  // namespace http
}  // namespace ctload

#endif  // CTLOAD_HTTP_HPP_
