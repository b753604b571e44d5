#include "ctload/rx_buffer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace ctload;

namespace {

bool push_text(RxBuffer& rx, const std::string& text) {
  return rx.push(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

}  // namespace

TEST_CASE("RxBuffer - starts empty", "[rx_buffer]") {
  RxBuffer rx(1024);
  REQUIRE(rx.empty());
  REQUIRE(rx.size() == 0);
  REQUIRE(rx.capacity() == 1024);
  REQUIRE(rx.view().empty());
}

TEST_CASE("RxBuffer - push, view, advance", "[rx_buffer]") {
  RxBuffer rx(64);
  REQUIRE(push_text(rx, "hello world"));
  REQUIRE(rx.view() == "hello world");

  rx.advance(6);
  REQUIRE(rx.view() == "world");
  rx.advance(100);  // clamps
  REQUIRE(rx.empty());
}

TEST_CASE("RxBuffer - readable bytes stay contiguous after compaction", "[rx_buffer]") {
  RxBuffer rx(16);
  REQUIRE(push_text(rx, "0123456789ab"));
  rx.advance(10);
  // 12 + 6 > 16 only fits after the consumed prefix is reclaimed
  REQUIRE(push_text(rx, "cdefgh"));
  REQUIRE(rx.view() == "abcdefgh");
}

TEST_CASE("RxBuffer - rejects data beyond capacity", "[rx_buffer]") {
  RxBuffer rx(8);
  REQUIRE(push_text(rx, "12345678"));
  REQUIRE(rx.full());
  REQUIRE(!push_text(rx, "9"));
  REQUIRE(rx.prepare(1) == 0);
  REQUIRE(rx.view() == "12345678");
}

TEST_CASE("RxBuffer - grows past the initial allocation", "[rx_buffer]") {
  const size_t capacity = RxBuffer::kInitialSize * 4;
  RxBuffer rx(capacity);
  std::string big(RxBuffer::kInitialSize * 3, 'x');
  REQUIRE(push_text(rx, big));
  REQUIRE(rx.size() == big.size());
  REQUIRE(rx.prepare(RxBuffer::kInitialSize) >= RxBuffer::kInitialSize);
}

TEST_CASE("RxBuffer - prepare/commit direct writes", "[rx_buffer]") {
  RxBuffer rx(32);
  size_t room = rx.prepare(4);
  REQUIRE(room >= 4);
  std::memcpy(rx.write_ptr(), "abcd", 4);
  rx.commit(4);
  REQUIRE(rx.view() == "abcd");

  rx.clear();
  REQUIRE(rx.empty());
}
