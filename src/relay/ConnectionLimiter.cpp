#include "ConnectionLimiter.hpp"

namespace hr {
ConnectionLimiter::ConnectionLimiter(int _maxConnections)
    : maxConnections(_maxConnections), activeConnections(0) {}

bool ConnectionLimiter::tryAcquire() {
  lock_guard<mutex> guard(limiterMutex);
  if (activeConnections >= maxConnections) {
    LOG(WARNING) << "Rate limit reached: " << activeConnections
                 << " active connections";
    return false;
  }
  activeConnections++;
  return true;
}

void ConnectionLimiter::release() {
  lock_guard<mutex> guard(limiterMutex);
  if (activeConnections <= 0) {
    STERROR << "Released a connection slot that was never acquired";
    return;
  }
  activeConnections--;
}

int ConnectionLimiter::getActive() const {
  lock_guard<mutex> guard(limiterMutex);
  return activeConnections;
}
}  // namespace hr
