#include "ctload/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstring>

#include <memory>
#include <string>

using namespace ctload;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success with value", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::success(42);
  REQUIRE(result.has_value());
  REQUIRE(result.value() == 42);
}

TEST_CASE("expected - error", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::error(ErrorCode::kConnectFailed);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kConnectFailed);
}

TEST_CASE("expected - bool conversion", "[vocabulary]") {
  auto ok = expected<int, ErrorCode>::success(1);
  auto err = expected<int, ErrorCode>::error(ErrorCode::kSocketError);
  REQUIRE(static_cast<bool>(ok) == true);
  REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("expected - value_or", "[vocabulary]") {
  auto ok = expected<int, ErrorCode>::success(10);
  auto err = expected<int, ErrorCode>::error(ErrorCode::kTimeout);
  REQUIRE(ok.value_or(99) == 10);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected - copy keeps string value", "[vocabulary]") {
  auto original = expected<std::string, ErrorCode>::success("stream");
  auto copy = original;
  REQUIRE(copy.has_value());
  REQUIRE(copy.value() == "stream");
  REQUIRE(original.value() == "stream");
}

TEST_CASE("expected - move-only value", "[vocabulary]") {
  auto original = expected<std::unique_ptr<int>, ErrorCode>::success(std::make_unique<int>(7));
  auto moved = std::move(original);
  REQUIRE(moved.has_value());
  REQUIRE(*moved.value() == 7);
}

TEST_CASE("expected - assignment replaces error with value", "[vocabulary]") {
  auto result = expected<std::string, ErrorCode>::error(ErrorCode::kTimeout);
  result = expected<std::string, ErrorCode>::success("late");
  REQUIRE(result.has_value());
  REQUIRE(result.value() == "late");
}

TEST_CASE("expected<void> - success", "[vocabulary]") {
  auto result = expected<void, ErrorCode>::success();
  REQUIRE(result.has_value());
}

TEST_CASE("expected<void> - error", "[vocabulary]") {
  auto result = expected<void, ErrorCode>::error(ErrorCode::kHandshakeFailed);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kHandshakeFailed);
}

TEST_CASE("ErrorCode - every code has a name", "[vocabulary]") {
  const ErrorCode codes[] = {
      ErrorCode::kOk,           ErrorCode::kInvalidEndpoint,   ErrorCode::kInvalidConfig,
      ErrorCode::kInvalidState, ErrorCode::kResolveFailed,     ErrorCode::kConnectFailed,
      ErrorCode::kHandshakeFailed, ErrorCode::kFrameParseError, ErrorCode::kConnectionClosed,
      ErrorCode::kSocketError,  ErrorCode::kTimeout,           ErrorCode::kBufferFull,
      ErrorCode::kTlsError,     ErrorCode::kTlsUnavailable,    ErrorCode::kInternalError};
  for (ErrorCode code : codes) {
    REQUIRE(std::strcmp(to_string(code), "unknown") != 0);
  }
  REQUIRE(std::string(to_string(ErrorCode::kTlsUnavailable)) == "tls support not built");
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional - empty", "[vocabulary]") {
  optional<int> opt;
  REQUIRE(!opt.has_value());
}

TEST_CASE("optional - with value", "[vocabulary]") {
  optional<int> opt(42);
  REQUIRE(opt.has_value());
  REQUIRE(opt.value() == 42);
}

TEST_CASE("optional - value_or", "[vocabulary]") {
  optional<int> empty;
  optional<int> full(10);
  REQUIRE(empty.value_or(99) == 99);
  REQUIRE(full.value_or(99) == 10);
}

TEST_CASE("optional - reset", "[vocabulary]") {
  optional<std::string> opt(std::string("abc"));
  REQUIRE(opt.has_value());
  opt.reset();
  REQUIRE(!opt.has_value());
}

TEST_CASE("optional - copy and move", "[vocabulary]") {
  optional<int> a(7);
  optional<int> b = a;
  optional<int> c = std::move(a);
  REQUIRE(b.has_value());
  REQUIRE(b.value() == 7);
  REQUIRE(c.value() == 7);
}
