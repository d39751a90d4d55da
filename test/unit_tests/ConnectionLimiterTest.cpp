#include "ConnectionLimiter.hpp"
#include "TestHeaders.hpp"

using namespace hr;

TEST_CASE("limiter admits up to the ceiling", "[ConnectionLimiter]") {
  ConnectionLimiter limiter(2);
  REQUIRE(limiter.getMaxConnections() == 2);
  REQUIRE(limiter.tryAcquire());
  REQUIRE(limiter.tryAcquire());
  REQUIRE(!limiter.tryAcquire());
  REQUIRE(limiter.getActive() == 2);

  limiter.release();
  REQUIRE(limiter.getActive() == 1);
  REQUIRE(limiter.tryAcquire());
  REQUIRE(!limiter.tryAcquire());
}

TEST_CASE("releasing an idle limiter does not go negative",
          "[ConnectionLimiter]") {
  ConnectionLimiter limiter(1);
  limiter.release();
  REQUIRE(limiter.getActive() == 0);
  REQUIRE(limiter.tryAcquire());
  REQUIRE(!limiter.tryAcquire());
}

TEST_CASE("limiter stays balanced across threads", "[ConnectionLimiter]") {
  ConnectionLimiter limiter(4);
  std::atomic<int> admitted(0);
  std::atomic<bool> overflowed(false);
  vector<std::thread> threads;
  for (int t = 0; t < 8; t++) {
    threads.emplace_back([&limiter, &admitted, &overflowed]() {
      for (int i = 0; i < 500; i++) {
        if (limiter.tryAcquire()) {
          admitted++;
          if (limiter.getActive() > 4) {
            overflowed = true;
          }
          limiter.release();
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  REQUIRE(admitted > 0);
  REQUIRE(!overflowed);
  REQUIRE(limiter.getActive() == 0);
}
