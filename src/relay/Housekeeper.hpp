#ifndef __HR_HOUSEKEEPER__
#define __HR_HOUSEKEEPER__

#include "Headers.hpp"

namespace hr {
/**
 * @brief Runs a task on a fixed period from a dedicated thread until stopped.
 *
 * The first run happens one full interval after `start()`.
 */
class Housekeeper {
 public:
  Housekeeper(Clock::duration _interval, std::function<void()> _task);
  ~Housekeeper();

  void start();
  /** @brief Wakes the thread and joins it. Safe to call more than once. */
  void stop();
  bool isRunning();

 protected:
  void run();

  Clock::duration interval;
  std::function<void()> task;
  std::unique_ptr<std::thread> timerThread;
  bool halt;
  mutex timerMutex;
  condition_variable timerCondition;
};
}  // namespace hr

#endif  // __HR_HOUSEKEEPER__
