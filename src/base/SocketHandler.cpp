#include "SocketHandler.hpp"

namespace hr {
#define SOCKET_DATA_TRANSFER_TIMEOUT (10)

int SocketHandler::writeAllOrReturn(int fd, const void* buf, size_t count) {
  size_t pos = 0;
  time_t startTime = time(NULL);
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
      return -1;
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        LOG(INFO) << "Got EAGAIN, waiting...";
        // This is fine, just keep retrying at 10hz
        std::this_thread::sleep_for(std::chrono::microseconds(100 * 1000));
      } else {
        VLOG(1) << "Failed a call to writeAll: " << strerror(localErrno);
        return -1;
      }
    } else if (bytesWritten == 0) {
      return 0;
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
  return count;
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        LOG(INFO) << "Got EAGAIN, waiting...";
        std::this_thread::sleep_for(std::chrono::microseconds(100 * 1000));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      startTime = currentTime;
    }
  }
}

optional<string> SocketHandler::readUntilEof(int fd, int64_t timeoutMs) {
  auto deadline = Clock::now() + std::chrono::milliseconds(timeoutMs);
  string result;
  char buf[4096];
  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::microseconds>(
        deadline - Clock::now());
    if (remaining.count() <= 0) {
      return nullopt;
    }
    if (!waitForData(fd, remaining.count() / 1000000,
                     remaining.count() % 1000000)) {
      continue;
    }
    ssize_t bytesRead = read(fd, buf, sizeof(buf));
    if (bytesRead == 0) {
      return result;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        continue;
      }
      VLOG(1) << "Failed a call to readUntilEof: " << strerror(localErrno);
      throw std::runtime_error("Failed a call to readUntilEof");
    }
    result.append(buf, bytesRead);
  }
}
}  // namespace hr
