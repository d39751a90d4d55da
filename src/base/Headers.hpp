#ifndef __HR_HEADERS__
#define __HR_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#if __APPLE__
#include <sys/ucred.h>
#elif __FreeBSD__
#include <sys/socket.h>
#endif

#include <errno.h>
#include <fcntl.h>
#include <paths.h>
#include <pthread.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "ThreadPool.h"
#include "easylogging++.h"

#if !defined(__ANDROID__)
#include "ust.hpp"
#endif

using namespace std;
namespace fs = std::filesystem;

#if defined(__ANDROID__)
#define STFATAL LOG(FATAL) << "No Stack Trace on Android" << endl

#define STERROR LOG(ERROR) << "No Stack Trace on Android" << endl
#else
#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()
#endif

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef HR_VERSION
#define HR_VERSION "unknown"
#endif

namespace hr {
/** @brief Monotonic clock used for every timeout, TTL and age in HookRelay. */
typedef std::chrono::steady_clock Clock;
typedef Clock::time_point TimePoint;

/**
 * @brief Shortens an identifier for log lines (session ids and tool use ids
 * are long and only the prefix is useful when reading logs).
 */
inline string shortId(const string &id, size_t length = 8) {
  if (id.length() <= length) {
    return id;
  }
  return id.substr(0, length);
}

inline bool waitOnSocketData(int fd, int64_t sec = 1, int64_t usec = 0) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = sec;
  tv.tv_usec = usec;
  VLOG(4) << "Before selecting fd " << fd;
  int result = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (result == -1) {
    if (GetErrno() == EINTR) {
      return false;
    }
    FATAL_FAIL(result);
  }
  return FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

}  // namespace hr

#endif
