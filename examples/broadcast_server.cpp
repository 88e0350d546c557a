#include "mws.hpp"
#include <iostream>
#include <string>

// Chat-style server: every message is relayed to all connected clients
int main(int argc, char* argv[]) {
  uint16_t port = mws::Server::kDefaultPort;

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  try {
    mws::Server server(port);
    server.set_tcp_tuning({/*tcp_nodelay=*/true, /*so_keepalive=*/true});

    server.on_connect = [](mws::Server& srv, const mws::ConnPtr& conn) {
      std::cout << "Client #" << conn->get_id() << " connected. (" << srv.get_connection_count() << " total)"
                << std::endl;
    };

    server.on_message = [](mws::Server& srv, const mws::ConnPtr& conn, std::string_view msg) {
      std::string relay = "Client #" + std::to_string(conn->get_id()) + ": " + std::string(msg);
      size_t delivered = srv.broadcast(mws::ws::Message::text(relay));
      MWS_LOG_DEBUG("relayed to " + std::to_string(delivered) + " client(s)");
    };

    server.on_close = [](mws::Server& srv, const mws::ConnPtr& conn, bool clean) {
      // Still registered while on_close runs
      std::cout << "Client #" << conn->get_id() << " closed (" << (clean ? "clean" : "unclean") << "). ("
                << srv.get_connection_count() - 1 << " remaining)" << std::endl;
    };

    server.run();

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
