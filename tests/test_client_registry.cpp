#include "mws/client_registry.hpp"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mws;

namespace {

// Unconnected socket: enough for identity and bookkeeping
ConnPtr make_conn() { return std::make_shared<Connection>(sockpp::tcp_socket{}); }

}  // namespace

TEST_CASE("ClientRegistry - starts empty", "[registry]") {
  ClientRegistry registry;
  REQUIRE(registry.empty());
  REQUIRE(registry.size() == 0);
  REQUIRE(registry.snapshot().empty());
}

TEST_CASE("ClientRegistry - add and remove", "[registry]") {
  ClientRegistry registry;
  auto a = make_conn();
  auto b = make_conn();

  registry.add(a);
  registry.add(b);
  REQUIRE(registry.size() == 2);
  REQUIRE(registry.contains(a));
  REQUIRE(registry.contains(b));

  registry.remove(a);
  REQUIRE(registry.size() == 1);
  REQUIRE(!registry.contains(a));
  REQUIRE(registry.contains(b));
}

TEST_CASE("ClientRegistry - connection ids are distinct", "[registry]") {
  auto a = make_conn();
  auto b = make_conn();
  REQUIRE(a->get_id() != b->get_id());
  REQUIRE(a->get_state() == ConnectionState::kConnecting);
}

TEST_CASE("ClientRegistry - for_each visits every member", "[registry]") {
  ClientRegistry registry;
  std::vector<ConnPtr> conns = {make_conn(), make_conn(), make_conn()};
  for (const auto& c : conns) {
    registry.add(c);
  }

  std::vector<ConnPtr> seen;
  registry.for_each([&seen](const ConnPtr& c) { seen.push_back(c); });
  REQUIRE(seen == conns);
  REQUIRE(registry.snapshot() == conns);
}

TEST_CASE("ClientRegistry - misuse throws", "[registry]") {
  ClientRegistry registry;
  auto a = make_conn();

  REQUIRE_THROWS_AS(registry.remove(a), std::logic_error);
  REQUIRE_THROWS_AS(registry.add(nullptr), std::logic_error);

  registry.add(a);
  REQUIRE_THROWS_AS(registry.add(a), std::logic_error);
  REQUIRE(registry.size() == 1);

  registry.remove(a);
  REQUIRE_THROWS_AS(registry.remove(a), std::logic_error);
}

TEST_CASE("ClientRegistry - concurrent add then remove leaves it empty", "[registry]") {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 50;

  ClientRegistry registry;
  std::vector<std::vector<ConnPtr>> owned(kThreads);
  for (auto& list : owned) {
    for (int i = 0; i < kPerThread; ++i) {
      list.push_back(make_conn());
    }
  }

  std::atomic<int> max_seen{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (const auto& c : owned[t]) {
        registry.add(c);
        int now = static_cast<int>(registry.size());
        int prev = max_seen.load();
        while (now > prev && !max_seen.compare_exchange_weak(prev, now)) {
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  REQUIRE(registry.size() == kThreads * kPerThread);
  REQUIRE(max_seen.load() == kThreads * kPerThread);

  threads.clear();
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (const auto& c : owned[t]) {
        registry.remove(c);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  REQUIRE(registry.empty());
}

TEST_CASE("ClientRegistry - for_each while others add", "[registry]") {
  ClientRegistry registry;
  std::atomic<bool> done{false};

  std::thread writer([&]() {
    for (int i = 0; i < 200; ++i) {
      auto c = make_conn();
      registry.add(c);
      registry.remove(c);
    }
    done = true;
  });

  while (!done) {
    size_t count = 0;
    registry.for_each([&count](const ConnPtr&) { ++count; });
    REQUIRE(count <= 1);
  }
  writer.join();
  REQUIRE(registry.empty());
}
