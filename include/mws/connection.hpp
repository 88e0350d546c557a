#ifndef MWS_CONNECTION_HPP_
#define MWS_CONNECTION_HPP_

#include "frame.hpp"
#include "server_stats.hpp"
#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>
#include <vector>

namespace mws {

// ============================================================================
// Connection lifecycle
// ============================================================================

enum class ConnectionState : uint8_t {
  kConnecting,   // socket accepted, session not started
  kHandshaking,  // waiting for the HTTP upgrade request
  kOpen,         // registered, receive loop running
  kClosing,      // peer closed or read failed, cleaning up
  kClosed        // socket closed, no further callbacks
};

const char* to_string(ConnectionState state);

// ============================================================================
// Read retry policy
// ============================================================================

/**
 * @brief Bounded retry for transient read errors (EINTR, EAGAIN, ENOBUFS, ENOMEM).
 *
 * Each consecutive transient failure sleeps for the current backoff, which
 * then doubles. Any other error, or running out of retries, ends the session.
 */
struct ReadRetryPolicy {
  int max_retries = 3;
  std::chrono::milliseconds initial_backoff{5};
};

// ============================================================================
// Connection (owns the client socket, serializes writes)
// ============================================================================

class Connection {
 public:
  // Request header bytes read at most before the handshake is attempted
  static constexpr size_t kDefaultMaxHandshakeSize = 8192;
  static constexpr size_t kReadChunkSize = 1024;

  // stats, when given, must outlive the connection
  explicit Connection(sockpp::tcp_socket&& sock, ServerStats* stats = nullptr);
  ~Connection();

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // --- User API (any thread) ---

  // Send a text frame. error(kInvalidState) unless the connection is open.
  expected<void, ErrorCode> send(std::string_view text) { return send(ws::Message::text(text)); }

  expected<void, ErrorCode> send_binary(std::string_view bytes) { return send(ws::Message::binary(bytes)); }

  expected<void, ErrorCode> send(const ws::Message& message);

  // Write an already encoded frame
  expected<void, ErrorCode> send_frame(const std::vector<uint8_t>& frame);

  uint64_t get_id() const { return id_; }

  ConnectionState get_state() const { return state_.load(std::memory_order_acquire); }

  // "ip:port" of the peer, empty if unknown
  const std::string& peer_address() const { return peer_; }

  int get_fd() const { return socket_.handle(); }

  uint64_t read_retries() const { return read_retries_.load(std::memory_order_relaxed); }

  // --- Session API (owning session thread only, except shutdown()) ---

  void set_read_retry_policy(const ReadRetryPolicy& policy) { retry_policy_ = policy; }

  // Read until the blank line ending the request headers, EOF, or max_bytes.
  // error(kConnectionClosed) if the peer closed before sending anything.
  // Bytes after the blank line are kept for the first read_frame().
  expected<std::string, ErrorCode> read_http_request(size_t max_bytes = kDefaultMaxHandshakeSize);

  // Raw bytes only, no frame is built around them. Used for the handshake reply.
  expected<void, ErrorCode> write_raw(std::string_view data);

  // Read exactly one client frame (header, mask key, payload) from the stream.
  // error(kConnectionClosed) on EOF at a frame boundary, kFrameParseError on
  // EOF inside a frame, kMessageTooLarge if the
  // declared payload exceeds max_payload, kSocketError on terminal read errors.
  expected<std::string, ErrorCode> read_frame(uint64_t max_payload);

  void transition_to_state(ConnectionState state);

  // Unblock a pending read or write from another thread without waiting for
  // the write lock. Safe after close().
  void shutdown();

  // Close the socket and enter kClosed
  void close();

 private:
  uint64_t id_;
  sockpp::tcp_socket socket_;
  std::string peer_;
  ServerStats* stats_;
  std::atomic<ConnectionState> state_{ConnectionState::kConnecting};

  // Serializes frame writes; held across blocking write_n()
  std::mutex write_mutex_;

  // Guards the descriptor against close() while shutdown() uses it. Never
  // held across blocking I/O. Lock order: write_mutex_, then fd_mutex_.
  std::mutex fd_mutex_;

  // Bytes read past the end of the handshake request, consumed before the socket
  std::string pending_;

  ReadRetryPolicy retry_policy_;
  std::atomic<uint64_t> read_retries_{0};

  expected<size_t, ErrorCode> read_some(uint8_t* buf, size_t len);
  expected<void, ErrorCode> read_exact(uint8_t* buf, size_t len);
  expected<void, ErrorCode> write_locked(const void* data, size_t len);

  static bool is_transient_error(int err);
};

using ConnPtr = std::shared_ptr<Connection>;

}  // namespace mws

#endif  // MWS_CONNECTION_HPP_
