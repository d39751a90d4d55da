#ifndef __HR_CONNECTION_LIMITER__
#define __HR_CONNECTION_LIMITER__

#include "Headers.hpp"

namespace hr {
/**
 * @brief Counts admitted connections against a fixed ceiling.
 *
 * A slot is acquired when a connection is accepted and released exactly once,
 * when that connection is finally closed.
 */
class ConnectionLimiter {
 public:
  explicit ConnectionLimiter(int _maxConnections);

  /** @return false (and logs) when the ceiling has been reached. */
  bool tryAcquire();
  void release();

  int getActive() const;
  int getMaxConnections() const { return maxConnections; }

 protected:
  const int maxConnections;
  int activeConnections;
  mutable mutex limiterMutex;
};
}  // namespace hr

#endif  // __HR_CONNECTION_LIMITER__
