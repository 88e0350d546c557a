#include "mws.hpp"
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
  uint16_t port = mws::Server::kDefaultPort;

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  try {
    mws::Server server(port);

    server.on_connect = [](mws::Server&, const mws::ConnPtr& conn) {
      std::cout << "Client #" << conn->get_id() << " connected from " << conn->peer_address() << std::endl;
      (void)conn->send("Welcome!");
    };

    server.on_message = [](mws::Server&, const mws::ConnPtr& conn, std::string_view msg) {
      std::cout << "Client #" << conn->get_id() << " sent " << msg.size() << " bytes" << std::endl;
      // Echo back
      auto sent = conn->send(std::string("Echo: ") + std::string(msg));
      if (!sent) {
        std::cerr << "Client #" << conn->get_id() << ": " << mws::to_string(sent.get_error()) << std::endl;
      }
    };

    server.on_close = [](mws::Server&, const mws::ConnPtr& conn, bool clean) {
      std::cout << "Client #" << conn->get_id() << " closed (" << (clean ? "clean" : "unclean") << ")" << std::endl;
    };

    server.run();

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
