#ifndef __HR_HOOK_CLIENT__
#define __HR_HOOK_CLIENT__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"
#include "SocketHandler.hpp"

namespace hr {
/**
 * @brief Emitter side of the hook socket: one connection carries one event.
 */
class HookClient {
 public:
  HookClient(shared_ptr<SocketHandler> _socketHandler,
             const SocketEndpoint& _endpoint);
  ~HookClient();

  /** @return false when nothing is listening on the endpoint. */
  bool connect();

  /**
   * @brief Writes the payload and half-closes the connection so the server
   * sees the end of the event.
   * @throws std::runtime_error if the server went away mid-write.
   */
  void send(const string& payload);

  /**
   * @brief Waits for the server to close the connection.
   * @return Whatever the server wrote before closing (empty for plain
   * notifications), or nullopt if the connection is still held open after
   * `timeoutMs`.
   */
  optional<string> readResponse(int64_t timeoutMs);

  void close();
  int getSocketFd() const { return socketFd; }

 protected:
  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  int socketFd;
};
}  // namespace hr

#endif  // __HR_HOOK_CLIENT__
