#ifndef MWS_CLIENT_REGISTRY_HPP_
#define MWS_CLIENT_REGISTRY_HPP_

#include "connection.hpp"
#include "vocabulary.hpp"

#include <cstddef>

#include <mutex>
#include <vector>

namespace mws {

// ============================================================================
// ClientRegistry - live, handshaken connections behind one lock
// ============================================================================

/**
 * @brief Set of open connections shared between session threads.
 *
 * A connection is a member from the moment its handshake succeeds until its
 * session loop exits. Every operation takes the same mutex, so a for_each()
 * broadcast cannot observe a connect or disconnect half way through.
 *
 * Iteration follows insertion order; callers must not depend on it.
 */
class ClientRegistry {
 public:
  ClientRegistry() = default;

  ClientRegistry(const ClientRegistry&) = delete;
  ClientRegistry& operator=(const ClientRegistry&) = delete;

  // Throws std::logic_error if conn is null or already registered
  void add(const ConnPtr& conn);

  // Throws std::logic_error if conn is not registered
  void remove(const ConnPtr& conn);

  // Copy of the current members, taken under the lock
  std::vector<ConnPtr> snapshot() const;

  // Invoke fn for every member while holding the lock. fn must not call
  // back into this registry.
  void for_each(function_ref<void(const ConnPtr&)> fn) const;

  bool contains(const ConnPtr& conn) const;

  size_t size() const;

  bool empty() const { return size() == 0; }

 private:
  mutable std::mutex mutex_;
  std::vector<ConnPtr> clients_;
};

}  // namespace mws

#endif  // MWS_CLIENT_REGISTRY_HPP_
