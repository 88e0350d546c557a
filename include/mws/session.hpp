#ifndef MWS_SESSION_HPP_
#define MWS_SESSION_HPP_

#include "connection.hpp"
#include "vocabulary.hpp"


namespace mws {

class Server;

// ============================================================================
// Session - per-client control loop
// ============================================================================

/**
 * @brief Drives one accepted connection through its whole life on the
 *        calling thread:
 *
 *   Connecting -> Handshaking -> Open -> Closing -> Closed
 *            \-> (handshake failed) -------------> Closed
 *
 * On entering Open the connection is registered and on_connect runs once
 * before the first read. Each decoded frame is passed to on_message in order.
 * The close sentinel, a close frame, EOF, a malformed frame or a terminal
 * read error moves the session to Closing, where on_close runs once; the
 * connection is then unregistered and its socket closed.
 *
 * An exception thrown by a callback ends this session only.
 */
class Session {
 public:
  Session(Server& server, const ConnPtr& conn) : server_(server), conn_(conn) {}

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  void run();

 private:
  Server& server_;
  ConnPtr conn_;

  // Handshaking -> Open. false if the request was unreadable or rejected.
  bool handshake();

  // Open loop. Returns true when the peer asked to close.
  bool receive_loop();

  void unregister_and_close();

  // Run an application callback; false if it threw
  template <typename F>
  bool invoke_callback(const char* name, F&& fn);
};

}  // namespace mws

#endif  // MWS_SESSION_HPP_
