#include "Housekeeper.hpp"

namespace hr {
Housekeeper::Housekeeper(Clock::duration _interval,
                         std::function<void()> _task)
    : interval(_interval), task(_task), halt(false) {}

Housekeeper::~Housekeeper() { stop(); }

void Housekeeper::start() {
  lock_guard<mutex> guard(timerMutex);
  if (timerThread) {
    LOG(WARNING) << "Housekeeper already running";
    return;
  }
  halt = false;
  timerThread.reset(new std::thread(&Housekeeper::run, this));
  VLOG(1) << "Housekeeper started (interval: "
          << std::chrono::duration_cast<std::chrono::milliseconds>(interval)
                 .count()
          << "ms)";
}

void Housekeeper::stop() {
  std::unique_ptr<std::thread> toJoin;
  {
    lock_guard<mutex> guard(timerMutex);
    halt = true;
    toJoin = std::move(timerThread);
  }
  timerCondition.notify_all();
  if (toJoin && toJoin->joinable()) {
    toJoin->join();
  }
}

bool Housekeeper::isRunning() {
  lock_guard<mutex> guard(timerMutex);
  return timerThread != nullptr;
}

void Housekeeper::run() {
  el::Helpers::setThreadName("housekeeper");
  auto nextRun = Clock::now() + interval;
  while (true) {
    {
      unique_lock<mutex> lock(timerMutex);
      if (timerCondition.wait_until(lock, nextRun, [this] { return halt; })) {
        return;
      }
    }
    try {
      task();
    } catch (const std::exception& e) {
      STERROR << "Housekeeping task failed: " << e.what();
    }
    nextRun += interval;
    auto now = Clock::now();
    if (nextRun < now) {
      // Fell behind (e.g. the machine slept); do not run a burst to catch up.
      nextRun = now + interval;
    }
  }
}
}  // namespace hr
