#include "mws/log.hpp"

#include <catch2/catch_test_macros.hpp>
#include <iostream>
#include <sstream>
#include <string>

using mws::Logger;

namespace {

// Redirects std::cerr for the lifetime of the object
class CerrCapture {
 public:
  CerrCapture() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CerrCapture() { std::cerr.rdbuf(old_); }

  std::string str() const { return buffer_.str(); }

 private:
  std::ostringstream buffer_;
  std::streambuf* old_;
};

}  // namespace

TEST_CASE("Logger - line format", "[log]") {
  Logger::set_level(Logger::Level::kInfo);
  CerrCapture capture;
  MWS_LOG_WARN("disk almost full");
  REQUIRE(capture.str() == "[MWS] [WARN] disk almost full\n");
}

TEST_CASE("Logger - level threshold filters output", "[log]") {
  CerrCapture capture;

  Logger::set_level(Logger::Level::kError);
  MWS_LOG_INFO("hidden");
  MWS_LOG_WARN("hidden");
  REQUIRE(capture.str().empty());
  MWS_LOG_ERROR("shown");
  REQUIRE(capture.str() == "[MWS] [ERROR] shown\n");

  Logger::set_level(Logger::Level::kDebug);
  MWS_LOG_DEBUG("trace");
  REQUIRE(capture.str().find("[MWS] [DEBUG] trace") != std::string::npos);

  Logger::set_level(Logger::Level::kInfo);
  REQUIRE(Logger::level() == Logger::Level::kInfo);
  REQUIRE(!Logger::enabled(Logger::Level::kDebug));
}
