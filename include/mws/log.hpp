/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * Logging utilities for MWS.
 * Provides MWS_LOG_DEBUG, MWS_LOG_INFO, MWS_LOG_WARN, MWS_LOG_ERROR macros.
 */

#ifndef MWS_LOG_HPP_
#define MWS_LOG_HPP_

#include <atomic>
#include <iostream>
#include <mutex>
#include <string>

namespace mws {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }

  static Level level() { return threshold().load(std::memory_order_relaxed); }

  static bool enabled(Level level) { return static_cast<int>(level) >= static_cast<int>(Logger::level()); }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level))
      return;
    static const char* const kPrefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    // Sessions log from their own threads; keep lines whole.
    std::lock_guard<std::mutex> lock(sink_mutex());
    std::cerr << "[MWS] " << kPrefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

 private:
  static std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::kInfo};
    return level;
  }

  static std::mutex& sink_mutex() {
    static std::mutex mutex;
    return mutex;
  }
};

#define MWS_LOG_DEBUG(msg)                                       \
  do {                                                           \
    if (::mws::Logger::enabled(::mws::Logger::Level::kDebug))    \
      ::mws::Logger::log(::mws::Logger::Level::kDebug, (msg));   \
  } while (0)
#define MWS_LOG_INFO(msg) ::mws::Logger::log(::mws::Logger::Level::kInfo, (msg))
#define MWS_LOG_WARN(msg) ::mws::Logger::log(::mws::Logger::Level::kWarn, (msg))
#define MWS_LOG_ERROR(msg) ::mws::Logger::log(::mws::Logger::Level::kError, (msg))

}  // namespace mws

#endif  // MWS_LOG_HPP_
