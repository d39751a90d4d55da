#ifndef __HR_HOOK_CONNECTION_HANDLER__
#define __HR_HOOK_CONNECTION_HANDLER__

#include "ConnectionLimiter.hpp"
#include "CorrelationCache.hpp"
#include "Headers.hpp"
#include "HookEvent.hpp"
#include "PendingPermissionTable.hpp"
#include "PermissionResponder.hpp"
#include "RelayConfig.hpp"
#include "SocketHandler.hpp"

namespace hr {
typedef std::function<void(const HookEvent&)> HookEventCallback;

/** @brief Why a connection's read loop stopped. */
enum class ReadEnd {
  PEER_CLOSED,
  /** @brief Data arrived, then a full poll interval passed in silence. */
  WENT_QUIET,
  TIMED_OUT,
  TOO_LARGE,
  READ_ERROR,
  HALTED,
};

struct ReadResult {
  /** @brief Set whenever at least one byte arrived within the limits. */
  optional<string> payload;
  ReadEnd end;
};

/**
 * @brief Owns one accepted hook connection from the first read until it is
 * either closed or parked as a pending permission.
 *
 * Reading happens on a reader thread; everything after the payload is
 * complete happens on the server's serialized queue.
 */
class HookConnectionHandler {
 public:
  HookConnectionHandler(shared_ptr<SocketHandler> _socketHandler,
                        shared_ptr<CorrelationCache> _cache,
                        shared_ptr<PendingPermissionTable> _pendingTable,
                        shared_ptr<ConnectionLimiter> _limiter,
                        shared_ptr<PermissionResponder> _responder,
                        const RelayConfig& _config);

  /**
   * @brief Reads until the peer closes, goes quiet after sending, errors, or
   * the read timeout elapses.
   * @return The payload, unset when nothing usable arrived, and how the read
   * ended. The connection is left open either way.
   */
  ReadResult readPayload(int fd, const std::atomic<bool>& halt);

  /**
   * @brief Decodes and routes one payload. Closes the connection unless it
   * was parked as a pending permission.
   */
  void handlePayload(int fd, const string& payload,
                     const HookEventCallback& onEvent);

  /** @brief Closes a connection that is not parked and frees its slot. */
  void closeConnection(int fd);

 protected:
  void handlePermissionRequest(int fd, const HookEvent& event,
                               const HookEventCallback& onEvent);

  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<CorrelationCache> cache;
  shared_ptr<PendingPermissionTable> pendingTable;
  shared_ptr<ConnectionLimiter> limiter;
  shared_ptr<PermissionResponder> responder;
  RelayConfig config;
};
}  // namespace hr

#endif  // __HR_HOOK_CONNECTION_HANDLER__
