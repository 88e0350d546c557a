#ifndef MWS_SERVER_HPP_
#define MWS_SERVER_HPP_

#include "client_registry.hpp"
#include "connection.hpp"
#include "frame.hpp"
#include "server_stats.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <sockpp/tcp_acceptor.h>
#include <string>
#include <string_view>
#include <vector>

namespace mws {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = false;   // Disable Nagle algorithm
  bool so_keepalive = false;  // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;      // Seconds before first keepalive probe
  int keepalive_interval_s = 10;  // Seconds between probes
  int keepalive_count = 5;        // Max probes before dropping connection
};

// ============================================================================
// Server (blocking listener, one thread per connection)
// ============================================================================

class Server {
 public:
  static constexpr uint16_t kDefaultPort = 8001;
  static constexpr int kListenBacklog = 128;
  static constexpr uint64_t kDefaultMaxMessageSize = 16 * 1024 * 1024;

  // Binds and listens immediately; throws std::runtime_error on failure.
  // Port 0 binds an ephemeral port, see port().
  explicit Server(uint16_t port = kDefaultPort, const std::string& bind_addr = "");

  // Stops accepting, shuts down live sessions and waits for their threads.
  // run() must have returned first.
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Accept loop (blocking). Returns only after stop().
  void run();

  // Close the listening socket so run() returns. A stopped server cannot be restarted.
  void stop();

  bool is_running() const { return is_running_.load(); }

  // Configuration (call before run())
  Server& set_tcp_tuning(const TcpTuning& tuning) {
    tcp_tuning_ = tuning;
    return *this;
  }

  Server& set_read_retry_policy(const ReadRetryPolicy& policy) {
    retry_policy_ = policy;
    return *this;
  }

  Server& set_max_message_size(uint64_t bytes) {
    max_message_size_ = bytes;
    return *this;
  }

  Server& set_max_handshake_size(size_t bytes) {
    max_handshake_size_ = bytes;
    return *this;
  }

  // Callbacks, invoked on the session thread of the connection
  std::function<void(Server&, const ConnPtr&)> on_connect;
  std::function<void(Server&, const ConnPtr&, std::string_view)> on_message;
  std::function<void(Server&, const ConnPtr&, bool)> on_close;

  // Handshaken connections whose session is still running
  ClientRegistry& clients() { return registry_; }
  const ClientRegistry& clients() const { return registry_; }

  size_t get_connection_count() const { return registry_.size(); }

  // Encode once and write to every registered client while holding the
  // registry lock. Returns the number of clients the frame was written to.
  size_t broadcast(const ws::Message& message);

  // Bound port (resolves port 0)
  uint16_t port() const;

  const ServerStats& stats() const { return stats_; }
  void reset_stats() { stats_.reset(); }

 private:
  friend class Session;

  uint16_t port_;
  std::string bind_addr_;
  sockpp::tcp_acceptor acceptor_;
  std::atomic<bool> is_running_{false};
  std::atomic<bool> stop_requested_{false};

  TcpTuning tcp_tuning_;
  ReadRetryPolicy retry_policy_;
  uint64_t max_message_size_ = kDefaultMaxMessageSize;
  size_t max_handshake_size_ = Connection::kDefaultMaxHandshakeSize;

  ClientRegistry registry_;
  ServerStats stats_;

  // Every connection whose session thread is still running, registered or not
  std::mutex sessions_mutex_;
  std::condition_variable sessions_done_;
  std::vector<ConnPtr> sessions_;

  void spawn_session(sockpp::tcp_socket&& sock);
  void run_session(const ConnPtr& conn);
  void finish_session(const ConnPtr& conn);
  void apply_tcp_tuning(int fd);
};

}  // namespace mws

#endif  // MWS_SERVER_HPP_
