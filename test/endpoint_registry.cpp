// endpoint_registry.cpp

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

//

#include "restcov/endpoint_registry.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

using restcov::endpoint;
using restcov::endpoint_id;
using restcov::endpoint_registry;
using restcov::hit_guard;


namespace {
std::vector<endpoint> sorted(std::vector<endpoint> endpoints) {
  std::sort(endpoints.begin(), endpoints.end());
  return endpoints;
}
} // namespace


TEST_CASE("recording", "[endpoint_registry]") {
  endpoint_registry registry;

  endpoint_id users = registry.record("GET", "/users");
  endpoint_id user  = registry.record("GET", "/users/:id");
  endpoint_id post  = registry.record("POST", "/users");

  SECTION("every record gives new id") {
    CHECK(users != user);
    CHECK(user != post);
    CHECK(users != post);
  }

  SECTION("new endpoints have no hits") {
    CHECK(sorted(registry.list()) == std::vector<endpoint>{
                                         {"GET", "/users", 0},
                                         {"POST", "/users", 0},
                                         {"GET", "/users/:id", 0},
                                     });
  }

  SECTION("get returns one endpoint") {
    std::optional<endpoint> found = registry.get(user);
    REQUIRE(found.has_value());
    CHECK(found->method == "GET");
    CHECK(found->path == "/users/:id");
    CHECK(found->hits == 0);

    CHECK_FALSE(registry.get(100).has_value());
  }
}


TEST_CASE("hits", "[endpoint_registry]") {
  endpoint_registry registry;

  endpoint_id first  = registry.record("GET", "/first");
  endpoint_id second = registry.record("GET", "/second");
  endpoint_id hidden = registry.record("GET", "/hidden", true);

  SECTION("hit increments only its endpoint") {
    for (int i = 0; i < 5; ++i) {
      registry.hit(first);
    }

    CHECK(registry.get(first)->hits == 5);
    CHECK(registry.get(second)->hits == 0);
  }

  SECTION("list is a snapshot") {
    std::vector<endpoint> before = registry.list();
    registry.hit(first);

    CHECK(sorted(before) == std::vector<endpoint>{
                                {"GET", "/first", 0},
                                {"GET", "/second", 0},
                            });
    CHECK(registry.get(first)->hits == 1);
  }

  SECTION("list without hits in between is the same") {
    registry.hit(second);
    CHECK(sorted(registry.list()) == sorted(registry.list()));
  }

  SECTION("unhit filter") {
    registry.hit(second);
    registry.hit(second);

    CHECK(registry.list(true) == std::vector<endpoint>{
                                     {"GET", "/first", 0},
                                 });

    std::vector<endpoint> all = registry.list(false);
    std::vector<endpoint> unhit;
    std::copy_if(all.begin(),
                 all.end(),
                 std::back_inserter(unhit),
                 [](const endpoint &item) {
                   return item.hits == 0;
                 });
    CHECK(sorted(unhit) == sorted(registry.list(true)));
  }

  SECTION("hidden endpoints are counted, but not listed") {
    registry.hit(hidden);

    CHECK(registry.get(hidden)->hits == 1);
    for (const endpoint &item : registry.list()) {
      CHECK(item.path != "/hidden");
    }
    for (const endpoint &item : registry.list(true)) {
      CHECK(item.path != "/hidden");
    }
  }
}


TEST_CASE("concurrent hits", "[endpoint_registry]") {
  constexpr int thread_count = 8;
  constexpr int hit_count    = 1000;

  endpoint_registry registry;
  endpoint_id       id = registry.record("GET", "/counter");

  std::vector<std::thread> threads;
  for (int i = 0; i < thread_count; ++i) {
    threads.emplace_back([&registry, id]() {
      for (int j = 0; j < hit_count; ++j) {
        registry.hit(id);
      }
    });
  }

  for (std::thread &thread : threads) {
    thread.join();
  }

  CHECK(registry.get(id)->hits == thread_count * hit_count);
}


TEST_CASE("hit guard", "[endpoint_registry]") {
  endpoint_registry registry;
  endpoint_id       id = registry.record("GET", "/guarded");

  SECTION("hit on normal exit") {
    { hit_guard guard{registry, id}; }

    CHECK(registry.get(id)->hits == 1);
  }

  SECTION("hit on exception") {
    auto failed = [&registry, id]() {
      hit_guard guard{registry, id};
      throw std::runtime_error{"handler failed"};
    };

    CHECK_THROWS_AS(failed(), std::runtime_error);
    CHECK(registry.get(id)->hits == 1);
  }

  SECTION("no id means no hit") {
    { hit_guard guard{registry, std::nullopt}; }

    CHECK(registry.get(id)->hits == 0);
  }
}
