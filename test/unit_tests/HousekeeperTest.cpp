#include "Housekeeper.hpp"
#include "TestHeaders.hpp"

using namespace hr;

TEST_CASE("housekeeper runs its task periodically", "[Housekeeper]") {
  std::atomic<int> runs(0);
  Housekeeper housekeeper(std::chrono::milliseconds(20), [&runs]() { runs++; });
  housekeeper.start();
  REQUIRE(housekeeper.isRunning());
  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  housekeeper.stop();
  REQUIRE(!housekeeper.isRunning());

  int seen = runs;
  REQUIRE(seen >= 3);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(runs == seen);
}

TEST_CASE("housekeeper waits a full interval before the first run",
          "[Housekeeper]") {
  std::atomic<int> runs(0);
  Housekeeper housekeeper(std::chrono::seconds(30), [&runs]() { runs++; });
  housekeeper.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto stopStart = Clock::now();
  housekeeper.stop();
  // Stopping wakes the thread instead of waiting out the interval.
  REQUIRE(Clock::now() - stopStart < std::chrono::seconds(5));
  REQUIRE(runs == 0);
  housekeeper.stop();
}

TEST_CASE("housekeeper survives a failing task and restarts",
          "[Housekeeper]") {
  std::atomic<int> runs(0);
  Housekeeper housekeeper(std::chrono::milliseconds(10), [&runs]() {
    runs++;
    throw std::runtime_error("sweep failed");
  });
  housekeeper.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  housekeeper.stop();
  REQUIRE(runs >= 2);

  int before = runs;
  housekeeper.start();
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  housekeeper.stop();
  REQUIRE(runs > before);
}
