#include "mws/client_registry.hpp"

#include "mws/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace mws {

void ClientRegistry::add(const ConnPtr& conn) {
  if (!conn) {
    MWS_THROW(std::logic_error("ClientRegistry::add: null connection"));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(clients_.begin(), clients_.end(), conn) != clients_.end()) {
    MWS_LOG_ERROR("Client #" + std::to_string(conn->get_id()) + " registered twice");
    MWS_THROW(std::logic_error("ClientRegistry::add: connection already registered"));
  }
  clients_.push_back(conn);
}

void ClientRegistry::remove(const ConnPtr& conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find(clients_.begin(), clients_.end(), conn);
  if (it == clients_.end()) {
    MWS_LOG_ERROR("Removing unregistered client #" + std::to_string(conn ? conn->get_id() : 0));
    MWS_THROW(std::logic_error("ClientRegistry::remove: connection not registered"));
  }
  // Erase rather than swap-and-pop to keep insertion order
  clients_.erase(it);
}

std::vector<ConnPtr> ClientRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_;
}

void ClientRegistry::for_each(function_ref<void(const ConnPtr&)> fn) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& conn : clients_) {
    fn(conn);
  }
}

bool ClientRegistry::contains(const ConnPtr& conn) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::find(clients_.begin(), clients_.end(), conn) != clients_.end();
}

size_t ClientRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.size();
}

}  // namespace mws
