#ifndef __HR_SOCKET_HANDLER__
#define __HR_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace hr {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Blocks for at most the given duration until fd becomes readable
   * (data or EOF).
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec) = 0;
  /**
   * @brief Reads up to count bytes from fd without waiting.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Attempts to write the full buffer and returns -1 on timeout/failure.
   * @return Total bytes written or -1 when the socket deadlocks.
   */
  int writeAllOrReturn(int fd, const void* buf, size_t count);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads until the peer closes its side of the connection.
   * @param timeoutMs Upper bound on the whole read.
   * @return Everything read, or nullopt if the peer was still open when the
   * timeout elapsed.
   * @throws std::runtime_error on I/O error.
   */
  optional<string> readUntilEof(int fd, int64_t timeoutMs);

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   * @throws std::runtime_error when the endpoint cannot be created.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint, int backlog) = 0;
  /**
   * @brief Returns any fds associated with the endpoint (listening or
   * otherwise).
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /** @brief Shuts down the sending side so the peer observes EOF. */
  virtual void shutdownWrite(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace hr

#endif  // __HR_SOCKET_HANDLER__
