#include "mws/server.hpp"

#include "mws/log.hpp"
#include "mws/session.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <algorithm>
#include <chrono>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <stdexcept>
#include <sys/socket.h>
#include <system_error>
#include <thread>

namespace mws {

Server::Server(uint16_t port, const std::string& bind_addr) : port_(port), bind_addr_(bind_addr) {
  sockpp::inet_address addr = bind_addr_.empty() ? sockpp::inet_address(port_)
                                                 : sockpp::inet_address(bind_addr_, port_);

  if (!acceptor_.open(addr, kListenBacklog)) {
    MWS_THROW(std::runtime_error("Failed to bind port " + std::to_string(port_) + ": " +
                                 acceptor_.last_error_str()));
  }

  MWS_LOG_INFO("Server initialized on " + (bind_addr_.empty() ? std::string("*") : bind_addr_) + ":" +
               std::to_string(port()));
}

Server::~Server() {
  stop();

  std::unique_lock<std::mutex> lock(sessions_mutex_);
  if (!sessions_.empty()) {
    MWS_LOG_INFO("Waiting for " + std::to_string(sessions_.size()) + " session(s) to finish");
  }
  for (const auto& conn : sessions_) {
    conn->shutdown();
  }
  sessions_done_.wait(lock, [this]() { return sessions_.empty(); });
}

void Server::run() {
  // A peer that vanished must surface as EPIPE on write, not kill the process
  std::signal(SIGPIPE, SIG_IGN);

  is_running_ = true;
  MWS_LOG_INFO("Server starting on port " + std::to_string(port()));

  while (!stop_requested_) {
    sockpp::tcp_socket sock = acceptor_.accept();
    if (!sock) {
      if (stop_requested_)
        break;

      int err = acceptor_.last_error();
      stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
      MWS_LOG_ERROR("Accept error: " + std::string(std::strerror(err)));

      // Out of descriptors or memory: give sessions a moment to release some
      if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      continue;
    }

    stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
    apply_tcp_tuning(sock.handle());
    spawn_session(std::move(sock));
  }

  is_running_ = false;
  MWS_LOG_INFO("Server stopped");
}

void Server::stop() {
  if (stop_requested_.exchange(true))
    return;
  // Wakes a blocked accept() with EINVAL
  acceptor_.shutdown();
}

size_t Server::broadcast(const ws::Message& message) {
  std::vector<uint8_t> frame = ws::encode_message(message);
  size_t delivered = 0;
  registry_.for_each([&](const ConnPtr& conn) {
    if (conn->send_frame(frame).has_value()) {
      ++delivered;
    }
  });
  return delivered;
}

uint16_t Server::port() const {
  struct sockaddr_storage addr;
  socklen_t len = sizeof(addr);
  if (::getsockname(acceptor_.handle(), reinterpret_cast<struct sockaddr*>(&addr), &len) != 0)
    return port_;

  if (addr.ss_family == AF_INET)
    return ntohs(reinterpret_cast<const struct sockaddr_in*>(&addr)->sin_port);
  if (addr.ss_family == AF_INET6)
    return ntohs(reinterpret_cast<const struct sockaddr_in6*>(&addr)->sin6_port);
  return port_;
}

void Server::spawn_session(sockpp::tcp_socket&& sock) {
  auto conn = std::make_shared<Connection>(std::move(sock), &stats_);
  conn->set_read_retry_policy(retry_policy_);

  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.push_back(conn);
    // Raced with shutdown: let the session see EOF straight away
    if (stop_requested_) {
      conn->shutdown();
    }
  }

  try {
    std::thread([this, conn]() { run_session(conn); }).detach();
  } catch (const std::system_error& e) {
    MWS_LOG_ERROR("Client #" + std::to_string(conn->get_id()) + ": cannot start session thread: " + e.what());
    conn->close();
    finish_session(conn);
  }
}

void Server::run_session(const ConnPtr& conn) {
  {
    Session session(*this, conn);
    try {
      session.run();
    } catch (const std::exception& e) {
      MWS_LOG_ERROR("Client #" + std::to_string(conn->get_id()) + ": session aborted: " + e.what());
      conn->close();
    } catch (...) {
      // Leaving the thread body with an exception would terminate the process
      MWS_LOG_ERROR("Client #" + std::to_string(conn->get_id()) + ": session aborted by an unknown exception");
      conn->close();
    }
  }
  stats_.read_retries.fetch_add(conn->read_retries(), std::memory_order_relaxed);
  finish_session(conn);
}

void Server::finish_session(const ConnPtr& conn) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto it = std::find(sessions_.begin(), sessions_.end(), conn);
  if (it != sessions_.end()) {
    sessions_.erase(it);
  }
  if (sessions_.empty()) {
    sessions_done_.notify_all();
  }
}

void Server::apply_tcp_tuning(int fd) {
  int opt = 1;

  if (tcp_tuning_.tcp_nodelay) {
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
  }

  if (tcp_tuning_.so_keepalive) {
    ::setsockopt(fd, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));

#ifdef TCP_KEEPIDLE
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPIDLE, &tcp_tuning_.keepalive_idle_s, sizeof(tcp_tuning_.keepalive_idle_s));
#endif
#ifdef TCP_KEEPINTVL
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPINTVL, &tcp_tuning_.keepalive_interval_s,
                 sizeof(tcp_tuning_.keepalive_interval_s));
#endif
#ifdef TCP_KEEPCNT
    ::setsockopt(fd, IPPROTO_TCP, TCP_KEEPCNT, &tcp_tuning_.keepalive_count, sizeof(tcp_tuning_.keepalive_count));
#endif
  }
}

}  // namespace mws
