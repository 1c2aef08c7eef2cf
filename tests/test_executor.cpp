#include "ediam/executor.hpp"
#include "ediam/sync.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace ediam;

// ============================================================================
// ThreadPerConnection
// ============================================================================

TEST_CASE("ThreadPerConnection - runs tasks concurrently", "[executor]") {
  ThreadPerConnection executor;
  Event release;
  std::atomic<int> started{0};

  for (int i = 0; i < 4; ++i) {
    REQUIRE(executor.submit([&release, &started]() {
      started.fetch_add(1);
      release.wait();
    }));
  }

  // All four block at once, so each has its own thread
  while (started.load() < 4) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  REQUIRE(executor.active() == 4);
  REQUIRE(!executor.wait_idle(std::chrono::milliseconds(10)));

  release.set();
  REQUIRE(executor.wait_idle(std::chrono::seconds(5)));
  REQUIRE(executor.active() == 0);
}

TEST_CASE("ThreadPerConnection - idle when nothing was submitted", "[executor]") {
  ThreadPerConnection executor;
  REQUIRE(executor.active() == 0);
  REQUIRE(executor.wait_idle(std::chrono::milliseconds(1)));
}

// ============================================================================
// BoundedPool
// ============================================================================

TEST_CASE("BoundedPool - rejects when the queue is full", "[executor]") {
  BoundedPool pool(1, 2);
  REQUIRE(pool.workers() == 1);

  Event release;
  Event running;
  std::atomic<int> done{0};

  REQUIRE(pool.submit([&release, &running]() {
    running.set();
    release.wait();
  }));
  REQUIRE(running.wait_for(std::chrono::seconds(5)));

  // The only worker is busy: two tasks may wait, the third is refused
  REQUIRE(pool.submit([&done]() { done.fetch_add(1); }));
  REQUIRE(pool.submit([&done]() { done.fetch_add(1); }));
  REQUIRE(pool.pending() == 2);
  REQUIRE(!pool.submit([&done]() { done.fetch_add(1); }));
  REQUIRE(pool.active() == 3);

  release.set();
  REQUIRE(pool.wait_idle(std::chrono::seconds(5)));
  REQUIRE(done.load() == 2);
}

TEST_CASE("BoundedPool - shutdown drains the queue", "[executor]") {
  std::atomic<int> done{0};
  {
    BoundedPool pool(2, 16);
    for (int i = 0; i < 10; ++i) {
      REQUIRE(pool.submit([&done]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        done.fetch_add(1);
      }));
    }
    pool.shutdown();
    REQUIRE(done.load() == 10);

    // Closed for business
    REQUIRE(!pool.submit([&done]() { done.fetch_add(1); }));
  }
  REQUIRE(done.load() == 10);
}

TEST_CASE("BoundedPool - zero workers means one", "[executor]") {
  BoundedPool pool(0, 1);
  REQUIRE(pool.workers() == 1);

  Event ran;
  REQUIRE(pool.submit([&ran]() { ran.set(); }));
  REQUIRE(ran.wait_for(std::chrono::seconds(5)));
}
