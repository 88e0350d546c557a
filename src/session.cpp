#include "mws/session.hpp"

#include "mws/frame.hpp"
#include "mws/handshake.hpp"
#include "mws/log.hpp"
#include "mws/server.hpp"

#include <stdexcept>
#include <string>

namespace mws {

namespace {

std::string client_tag(const ConnPtr& conn) {
  return "Client #" + std::to_string(conn->get_id()) + " (" + conn->peer_address() + ")";
}

}  // namespace

template <typename F>
bool Session::invoke_callback(const char* name, F&& fn) {
  try {
    fn();
    return true;
  } catch (const std::exception& e) {
    server_.stats_.callback_errors.fetch_add(1, std::memory_order_relaxed);
    MWS_LOG_ERROR(client_tag(conn_) + ": " + name + " threw: " + e.what());
    return false;
  } catch (...) {
    server_.stats_.callback_errors.fetch_add(1, std::memory_order_relaxed);
    MWS_LOG_ERROR(client_tag(conn_) + ": " + name + " threw an unknown exception");
    return false;
  }
}

void Session::run() {
  conn_->transition_to_state(ConnectionState::kHandshaking);
  if (!handshake()) {
    conn_->close();
    return;
  }

  conn_->transition_to_state(ConnectionState::kOpen);
  server_.registry_.add(conn_);
  server_.stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
  ScopeGuard leave([this]() { unregister_and_close(); });

  MWS_LOG_INFO(client_tag(conn_) + " connected");

  bool clean = false;
  bool connected = invoke_callback("on_connect", [this]() {
    if (server_.on_connect)
      server_.on_connect(server_, conn_);
  });
  if (connected) {
    clean = receive_loop();
  }

  conn_->transition_to_state(ConnectionState::kClosing);
  invoke_callback("on_close", [this, clean]() {
    if (server_.on_close)
      server_.on_close(server_, conn_, clean);
  });
}

bool Session::handshake() {
  auto request = conn_->read_http_request(server_.max_handshake_size_);
  if (!request.has_value()) {
    server_.stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
    MWS_LOG_WARN(client_tag(conn_) + ": no handshake request (" + to_string(request.get_error()) + ")");
    return false;
  }

  auto response = ws::process_handshake(request.value());
  if (!response.has_value()) {
    server_.stats_.handshake_errors.fetch_add(1, std::memory_order_relaxed);
    MWS_LOG_WARN(client_tag(conn_) + ": handshake rejected");
    auto sent = conn_->write_raw(ws::kRejectResponse);
    if (!sent.has_value()) {
      MWS_LOG_DEBUG(client_tag(conn_) + ": reject response not delivered");
    }
    return false;
  }

  auto sent = conn_->write_raw(response.value());
  if (!sent.has_value()) {
    server_.stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
    MWS_LOG_WARN(client_tag(conn_) + ": failed to send upgrade response");
    return false;
  }
  return true;
}

bool Session::receive_loop() {
  while (true) {
    auto raw = conn_->read_frame(server_.max_message_size_);
    if (!raw.has_value()) {
      switch (raw.get_error()) {
        case ErrorCode::kConnectionClosed:
          MWS_LOG_DEBUG(client_tag(conn_) + ": peer closed the stream");
          break;
        case ErrorCode::kFrameParseError:
        case ErrorCode::kMessageTooLarge:
          server_.stats_.malformed_frames.fetch_add(1, std::memory_order_relaxed);
          MWS_LOG_WARN(client_tag(conn_) + ": " + to_string(raw.get_error()));
          break;
        default:
          server_.stats_.socket_errors.fetch_add(1, std::memory_order_relaxed);
          MWS_LOG_WARN(client_tag(conn_) + ": read failed (" + to_string(raw.get_error()) + ")");
          break;
      }
      return false;
    }

    auto decoded = ws::decode_frame(raw.value());
    if (!decoded.has_value()) {
      server_.stats_.malformed_frames.fetch_add(1, std::memory_order_relaxed);
      MWS_LOG_WARN(client_tag(conn_) + ": malformed frame");
      return false;
    }

    if (!decoded.value().has_value()) {
      MWS_LOG_DEBUG(client_tag(conn_) + ": close sentinel received");
      return true;
    }

    const ws::DecodedFrame& frame = decoded.value().value();
    if (frame.opcode == ws::OpCode::kClose) {
      MWS_LOG_DEBUG(client_tag(conn_) + ": close frame received");
      return true;
    }

    server_.stats_.messages_in.fetch_add(1, std::memory_order_relaxed);
    server_.stats_.bytes_in.fetch_add(frame.payload.size(), std::memory_order_relaxed);

    std::string_view payload(frame.payload);
    bool ok = invoke_callback("on_message", [this, payload]() {
      if (server_.on_message)
        server_.on_message(server_, conn_, payload);
    });
    if (!ok)
      return false;
  }
}

void Session::unregister_and_close() {
  try {
    server_.registry_.remove(conn_);
  } catch (const std::logic_error& e) {
    MWS_LOG_ERROR(client_tag(conn_) + ": " + e.what());
  }
  server_.stats_.active_connections.fetch_sub(1, std::memory_order_relaxed);
  conn_->close();
  MWS_LOG_INFO(client_tag(conn_) + " disconnected");
}

}  // namespace mws
