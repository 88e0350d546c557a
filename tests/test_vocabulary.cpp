#include "mws/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace mws;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success with value", "[vocabulary]") {
  auto result = expected<std::string, ErrorCode>::success(std::string("payload"));
  REQUIRE(result.has_value());
  REQUIRE(result.value() == "payload");
}

TEST_CASE("expected - error", "[vocabulary]") {
  auto result = expected<std::string, ErrorCode>::error(ErrorCode::kFrameParseError);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kFrameParseError);
  REQUIRE(result.value_or("fallback") == "fallback");
}

TEST_CASE("expected - copy and move keep the value", "[vocabulary]") {
  auto original = expected<std::vector<int>, ErrorCode>::success(std::vector<int>{1, 2, 3});
  auto copy = original;
  REQUIRE(copy.has_value());
  REQUIRE(copy.value().size() == 3);

  auto moved = static_cast<expected<std::vector<int>, ErrorCode>&&>(original);
  REQUIRE(moved.has_value());
  REQUIRE(moved.value() == std::vector<int>{1, 2, 3});
}

TEST_CASE("expected - assignment switches between value and error", "[vocabulary]") {
  auto slot = expected<std::string, ErrorCode>::success(std::string("a"));
  slot = expected<std::string, ErrorCode>::error(ErrorCode::kSocketError);
  REQUIRE(!slot);
  REQUIRE(slot.get_error() == ErrorCode::kSocketError);

  slot = expected<std::string, ErrorCode>::success(std::string("b"));
  REQUIRE(slot);
  REQUIRE(slot.value() == "b");
}

TEST_CASE("expected<void> - success and error", "[vocabulary]") {
  auto ok = expected<void, ErrorCode>::success();
  auto err = expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  REQUIRE(ok.has_value());
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == ErrorCode::kConnectionClosed);
}

TEST_CASE("ErrorCode - every code has a name", "[vocabulary]") {
  const ErrorCode codes[] = {ErrorCode::kOk,           ErrorCode::kHandshakeFailed,  ErrorCode::kFrameParseError,
                             ErrorCode::kMessageTooLarge, ErrorCode::kConnectionClosed, ErrorCode::kSocketError,
                             ErrorCode::kInvalidState, ErrorCode::kInternalError};
  for (ErrorCode code : codes) {
    REQUIRE(std::string(to_string(code)) != "unknown");
  }
  REQUIRE(std::string(to_string(ErrorCode::kFrameParseError)) == "malformed frame");
}

// ============================================================================
// optional<T>
// ============================================================================

TEST_CASE("optional - empty and engaged", "[vocabulary]") {
  optional<std::string> empty;
  optional<std::string> full(std::string("key"));
  REQUIRE(!empty.has_value());
  REQUIRE(full.has_value());
  REQUIRE(full.value() == "key");
  REQUIRE(empty.value_or("none") == "none");
}

TEST_CASE("optional - reset", "[vocabulary]") {
  optional<int> opt(5);
  opt.reset();
  REQUIRE(!opt);
}

TEST_CASE("optional - copy and move", "[vocabulary]") {
  optional<std::string> a(std::string("x"));
  optional<std::string> b = a;
  REQUIRE(b.value() == "x");
  optional<std::string> c = static_cast<optional<std::string>&&>(a);
  REQUIRE(c.value() == "x");
}

// ============================================================================
// function_ref / ScopeGuard
// ============================================================================

TEST_CASE("function_ref - calls the referenced lambda", "[vocabulary]") {
  int total = 0;
  auto add = [&total](int n) { total += n; };
  function_ref<void(int)> ref(add);
  ref(3);
  ref(4);
  REQUIRE(total == 7);
}

TEST_CASE("ScopeGuard - runs on scope exit", "[vocabulary]") {
  int runs = 0;
  {
    ScopeGuard guard([&runs]() { ++runs; });
    REQUIRE(runs == 0);
  }
  REQUIRE(runs == 1);
}

TEST_CASE("ScopeGuard - release cancels cleanup", "[vocabulary]") {
  int runs = 0;
  {
    ScopeGuard guard([&runs]() { ++runs; });
    guard.release();
  }
  REQUIRE(runs == 0);
}
