#include "mws/connection.hpp"

#include "mws/log.hpp"

#include <cerrno>
#include <cstring>

#include <algorithm>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>

namespace mws {

namespace {

std::atomic<uint64_t> g_next_conn_id{1};

std::string describe_peer(int fd) {
  struct sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  if (fd < 0 || ::getpeername(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0)
    return {};

  char host[INET6_ADDRSTRLEN] = {0};
  uint16_t port = 0;
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const struct sockaddr_in*>(&addr);
    ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
    port = ntohs(in->sin_port);
  } else if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const struct sockaddr_in6*>(&addr);
    ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
    port = ntohs(in6->sin6_port);
  } else {
    return {};
  }
  return std::string(host) + ":" + std::to_string(port);
}

}  // namespace

const char* to_string(ConnectionState state) {
  switch (state) {
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kHandshaking:
      return "handshaking";
    case ConnectionState::kOpen:
      return "open";
    case ConnectionState::kClosing:
      return "closing";
    case ConnectionState::kClosed:
      return "closed";
  }
  return "unknown";
}

Connection::Connection(sockpp::tcp_socket&& sock, ServerStats* stats)
    : id_(g_next_conn_id.fetch_add(1, std::memory_order_relaxed)), socket_(std::move(sock)), stats_(stats) {
  peer_ = describe_peer(socket_.handle());
}

Connection::~Connection() {
  if (socket_.is_open()) {
    socket_.close();
  }
}

// ============================================================================
// Writes
// ============================================================================

expected<void, ErrorCode> Connection::send(const ws::Message& message) {
  return send_frame(ws::encode_message(message));
}

expected<void, ErrorCode> Connection::send_frame(const std::vector<uint8_t>& frame) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (get_state() != ConnectionState::kOpen) {
    MWS_LOG_DEBUG("Client #" + std::to_string(id_) + ": cannot send, connection " + to_string(get_state()));
    return expected<void, ErrorCode>::error(ErrorCode::kInvalidState);
  }
  auto result = write_locked(frame.data(), frame.size());
  if (result.has_value() && stats_ != nullptr) {
    stats_->messages_out.fetch_add(1, std::memory_order_relaxed);
    stats_->bytes_out.fetch_add(frame.size(), std::memory_order_relaxed);
  }
  return result;
}

expected<void, ErrorCode> Connection::write_raw(std::string_view data) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!socket_.is_open())
    return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
  return write_locked(data.data(), data.size());
}

expected<void, ErrorCode> Connection::write_locked(const void* data, size_t len) {
  if (len == 0)
    return expected<void, ErrorCode>::success();

  ssize_t n = socket_.write_n(data, len);
  if (n < 0 || static_cast<size_t>(n) != len) {
    MWS_LOG_WARN("Client #" + std::to_string(id_) + ": write error: " + socket_.last_error_str());
    return expected<void, ErrorCode>::error(ErrorCode::kSocketError);
  }
  return expected<void, ErrorCode>::success();
}

// ============================================================================
// Reads
// ============================================================================

bool Connection::is_transient_error(int err) {
  return err == EINTR || err == EAGAIN || err == EWOULDBLOCK || err == ENOBUFS || err == ENOMEM;
}

expected<size_t, ErrorCode> Connection::read_some(uint8_t* buf, size_t len) {
  int retries = 0;
  auto backoff = retry_policy_.initial_backoff;

  while (true) {
    ssize_t n = socket_.read(buf, len);
    if (n > 0)
      return expected<size_t, ErrorCode>::success(static_cast<size_t>(n));
    if (n == 0)
      return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);

    int err = socket_.last_error();
    if (!is_transient_error(err)) {
      MWS_LOG_WARN("Client #" + std::to_string(id_) + ": read error: " + std::strerror(err));
      return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
    }
    if (retries >= retry_policy_.max_retries) {
      MWS_LOG_WARN("Client #" + std::to_string(id_) + ": giving up after " + std::to_string(retries) +
                   " transient read errors: " + std::strerror(err));
      return expected<size_t, ErrorCode>::error(ErrorCode::kSocketError);
    }

    ++retries;
    read_retries_.fetch_add(1, std::memory_order_relaxed);
    MWS_LOG_DEBUG("Client #" + std::to_string(id_) + ": transient read error (" + std::strerror(err) + "), retry " +
                  std::to_string(retries));
    std::this_thread::sleep_for(backoff);
    backoff *= 2;
  }
}

expected<void, ErrorCode> Connection::read_exact(uint8_t* buf, size_t len) {
  size_t got = std::min(len, pending_.size());
  if (got > 0) {
    std::memcpy(buf, pending_.data(), got);
    pending_.erase(0, got);
  }
  while (got < len) {
    auto n = read_some(buf + got, len - got);
    if (!n.has_value())
      return expected<void, ErrorCode>::error(n.get_error());
    got += n.value();
  }
  return expected<void, ErrorCode>::success();
}

expected<std::string, ErrorCode> Connection::read_http_request(size_t max_bytes) {
  std::string request;
  uint8_t chunk[kReadChunkSize];

  while (request.size() < max_bytes) {
    size_t want = std::min(sizeof(chunk), max_bytes - request.size());
    auto n = read_some(chunk, want);
    if (!n.has_value()) {
      // A peer that sends its request and half-closes still gets an answer
      if (n.get_error() == ErrorCode::kConnectionClosed && !request.empty())
        break;
      return expected<std::string, ErrorCode>::error(n.get_error());
    }
    request.append(reinterpret_cast<const char*>(chunk), n.value());
    size_t end = request.find("\r\n\r\n");
    if (end != std::string::npos) {
      // A client may pipeline its first frame behind the request
      pending_ = request.substr(end + 4);
      request.resize(end + 4);
      break;
    }
  }
  return expected<std::string, ErrorCode>::success(std::move(request));
}

expected<std::string, ErrorCode> Connection::read_frame(uint64_t max_payload) {
  using Result = expected<std::string, ErrorCode>;

  uint8_t header[ws::kMaxHeaderSize];
  auto r = read_exact(header, 1);
  if (!r.has_value())
    return Result::error(r.get_error());

  // Past the first byte, EOF means a truncated frame
  r = read_exact(header + 1, 1);
  if (!r.has_value())
    return Result::error(r.get_error() == ErrorCode::kConnectionClosed ? ErrorCode::kFrameParseError
                                                                       : r.get_error());

  size_t ext_len = 0;
  uint8_t len7 = header[1] & 0x7F;
  if (len7 == 126) {
    ext_len = 2;
  } else if (len7 == 127) {
    ext_len = 8;
  }

  // Extended length plus the client mask key
  r = read_exact(header + 2, ext_len + 4);
  if (!r.has_value())
    return Result::error(r.get_error() == ErrorCode::kConnectionClosed ? ErrorCode::kFrameParseError
                                                                       : r.get_error());

  uint64_t payload_len = len7;
  if (ext_len > 0) {
    payload_len = 0;
    for (size_t i = 0; i < ext_len; ++i) {
      payload_len = (payload_len << 8) | header[2 + i];
    }
  }
  if (payload_len > max_payload) {
    MWS_LOG_WARN("Client #" + std::to_string(id_) + ": frame payload of " + std::to_string(payload_len) +
                 " bytes exceeds limit of " + std::to_string(max_payload));
    return Result::error(ErrorCode::kMessageTooLarge);
  }

  size_t header_len = 2 + ext_len + 4;
  std::string frame(header_len + static_cast<size_t>(payload_len), '\0');
  std::memcpy(&frame[0], header, header_len);
  if (payload_len > 0) {
    r = read_exact(reinterpret_cast<uint8_t*>(&frame[header_len]), static_cast<size_t>(payload_len));
    if (!r.has_value())
      return Result::error(r.get_error() == ErrorCode::kConnectionClosed ? ErrorCode::kFrameParseError
                                                                         : r.get_error());
  }
  return Result::success(std::move(frame));
}

// ============================================================================
// Lifecycle
// ============================================================================

void Connection::transition_to_state(ConnectionState state) {
  ConnectionState prev = state_.exchange(state, std::memory_order_acq_rel);
  MWS_LOG_DEBUG("Client #" + std::to_string(id_) + ": " + to_string(prev) + " -> " + to_string(state));
}

void Connection::shutdown() {
  // A writer blocked on a full send buffer holds write_mutex_; shutdown(2)
  // is what wakes it, so only the descriptor lock is taken here.
  std::lock_guard<std::mutex> lock(fd_mutex_);
  if (socket_.is_open()) {
    socket_.shutdown(SHUT_RDWR);
  }
}

void Connection::close() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  std::lock_guard<std::mutex> fd_lock(fd_mutex_);
  if (socket_.is_open()) {
    socket_.close();
  }
  transition_to_state(ConnectionState::kClosed);
}

}  // namespace mws
