#include "mws.hpp"
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

// Key/value state mirror. A new client receives the whole state as one delta;
// "set <key> <value>" and "del <key>" from any client are applied and
// broadcast to everyone as deltas.
int main(int argc, char* argv[]) {
  uint16_t port = mws::Server::kDefaultPort;

  if (argc > 1) {
    port = static_cast<uint16_t>(std::stoi(argv[1]));
  }

  std::map<std::string, std::string> state;
  // Held across send/broadcast so every client sees updates in one order
  std::mutex state_mutex;

  try {
    mws::Server server(port);

    server.on_connect = [&](mws::Server&, const mws::ConnPtr& conn) {
      std::lock_guard<std::mutex> lock(state_mutex);
      mws::ws::Delta snapshot;
      for (const auto& kv : state) {
        snapshot.updates.emplace_back(kv.first, kv.second);
      }
      (void)conn->send(mws::ws::Message::delta(std::move(snapshot)));
      std::cout << "Client #" << conn->get_id() << " synced " << state.size() << " key(s)" << std::endl;
    };

    server.on_message = [&](mws::Server& srv, const mws::ConnPtr& conn, std::string_view msg) {
      std::istringstream in{std::string(msg)};
      std::string command;
      std::string key;
      in >> command >> key;

      mws::ws::Delta delta;
      std::lock_guard<std::mutex> lock(state_mutex);
      if (command == "set" && !key.empty()) {
        std::string value;
        std::getline(in >> std::ws, value);
        state[key] = value;
        delta.updates.emplace_back(key, value);
      } else if (command == "del" && !key.empty()) {
        state.erase(key);
        delta.deletes.push_back(key);
      } else {
        (void)conn->send("unknown command, expected 'set <key> <value>' or 'del <key>'");
        return;
      }
      srv.broadcast(mws::ws::Message::delta(std::move(delta)));
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
