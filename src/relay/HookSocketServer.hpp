#ifndef __HR_HOOK_SOCKET_SERVER__
#define __HR_HOOK_SOCKET_SERVER__

#include "ConnectionLimiter.hpp"
#include "CorrelationCache.hpp"
#include "Headers.hpp"
#include "HookConnectionHandler.hpp"
#include "HookEvent.hpp"
#include "Housekeeper.hpp"
#include "PendingPermissionTable.hpp"
#include "PermissionResponder.hpp"
#include "RelayConfig.hpp"
#include "SocketEndpoint.hpp"
#include "SocketHandler.hpp"

namespace hr {
/**
 * @brief Listens on the hook socket, correlates permission requests with the
 * tool invocations that caused them and relays decisions back.
 *
 * All table mutations and both callbacks run on one serialized queue, so
 * callbacks observe events in processing order. Public methods may be called
 * from any thread; only stop() and flush() must not be called from inside a
 * callback.
 */
class HookSocketServer {
 public:
  HookSocketServer(shared_ptr<SocketHandler> _socketHandler,
                   const RelayConfig& _config);
  ~HookSocketServer();

  /**
   * @brief Binds the endpoint and starts accepting.
   * @return false (after logging) when the endpoint could not be created. The
   * server is then inert and may be started again later.
   */
  bool start(HookEventCallback onEvent,
             PermissionDeliveryFailedCallback onPermissionFailure);
  /**
   * @brief Stops accepting, closes every held connection, clears the cache and
   * removes the endpoint from the filesystem.
   */
  void stop();
  bool isRunning() const { return running; }

  void respondToPermission(const string& toolUseId,
                           PermissionDecision decision,
                           const optional<string>& reason = nullopt);
  void respondToPermissionBySession(const string& sessionId,
                                    PermissionDecision decision,
                                    const optional<string>& reason = nullopt);
  void cancelPendingPermission(const string& toolUseId);
  void cancelPendingPermissions(const string& sessionId);

  bool hasPendingPermission(const string& sessionId) const;
  optional<PendingPermissionInfo> getPendingPermission(
      const string& sessionId) const;

  int getActiveConnections() const { return limiter->getActive(); }
  size_t getCachedInvocationCount() const { return cache->size(); }

  /** @brief Blocks until everything queued so far has been processed. */
  void flush();

 protected:
  void run();
  void acceptNewConnection(int listenFd);
  void readConnection(int fd);
  void sweepCache();
  /** @brief Posts a task onto the serialized queue. */
  bool enqueueStateTask(std::function<void()> task);

  shared_ptr<SocketHandler> socketHandler;
  RelayConfig config;
  SocketEndpoint endpoint;

  shared_ptr<CorrelationCache> cache;
  shared_ptr<PendingPermissionTable> pendingTable;
  shared_ptr<ConnectionLimiter> limiter;
  shared_ptr<PermissionResponder> responder;
  shared_ptr<HookConnectionHandler> connectionHandler;
  Housekeeper housekeeper;

  HookEventCallback onEvent;

  std::atomic<bool> running;
  std::atomic<bool> halt;
  std::unique_ptr<std::thread> acceptThread;
  std::unique_ptr<ThreadPool> readerPool;
  std::unique_ptr<ThreadPool> stateQueue;
  /** @brief Guards the two pools and the callback against start/stop. */
  mutable recursive_mutex serverMutex;
  /** @brief Serializes start() and stop() against each other. */
  mutex lifecycleMutex;
};
}  // namespace hr

#endif  // __HR_HOOK_SOCKET_SERVER__
