#ifndef __HR_PIPE_SOCKET_HANDLER__
#define __HR_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace hr {
/**
 * @brief Handles UNIX domain stream sockets bound to a filesystem path.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a pipe identified by the endpoint name.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening UNIX socket and stores it internally.
   *
   * Any file already present at the path is removed first, and the socket is
   * made accessible to the owning user only.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint, int backlog);
  /**
   * @brief Returns the listening fds for a previously registered pipe.
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the specified pipe, closes its fd and removes
   * the path from the filesystem.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors for each pipe. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace hr

#endif  // __HR_PIPE_SOCKET_HANDLER__
