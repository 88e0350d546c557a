#ifndef MWS_SERVER_STATS_HPP_
#define MWS_SERVER_STATS_HPP_

#include <cstdint>

#include <atomic>

namespace mws {

// ============================================================================
// ServerStats - Atomic counters shared by the listener and all sessions
// ============================================================================

struct ServerStats {
  // Connection counters
  std::atomic<uint64_t> total_connections{0};   // sockets accepted
  std::atomic<uint64_t> active_connections{0};  // sessions in kOpen
  std::atomic<uint64_t> handshake_errors{0};

  // Throughput counters
  std::atomic<uint64_t> messages_in{0};
  std::atomic<uint64_t> messages_out{0};
  std::atomic<uint64_t> bytes_in{0};
  std::atomic<uint64_t> bytes_out{0};

  // Error counters
  std::atomic<uint64_t> accept_errors{0};
  std::atomic<uint64_t> socket_errors{0};
  std::atomic<uint64_t> malformed_frames{0};
  std::atomic<uint64_t> read_retries{0};
  std::atomic<uint64_t> callback_errors{0};

  // Zeroes the counters. active_connections is a gauge of live sessions and
  // is left alone, since each of them still decrements it on exit.
  void reset() {
    total_connections = 0;
    handshake_errors = 0;
    messages_in = 0;
    messages_out = 0;
    bytes_in = 0;
    bytes_out = 0;
    accept_errors = 0;
    socket_errors = 0;
    malformed_frames = 0;
    read_retries = 0;
    callback_errors = 0;
  }
};

}  // namespace mws

#endif  // MWS_SERVER_STATS_HPP_
