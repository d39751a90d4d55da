#ifndef __HR_PERMISSION_RESPONDER__
#define __HR_PERMISSION_RESPONDER__

#include "ConnectionLimiter.hpp"
#include "Headers.hpp"
#include "PendingPermissionTable.hpp"
#include "SocketHandler.hpp"

namespace hr {
/** @brief Invoked with (sessionId, toolUseId) when a decision was lost. */
typedef std::function<void(const string&, const string&)>
    PermissionDeliveryFailedCallback;

/**
 * @brief Delivers decisions to, or cancels, parked permission connections.
 *
 * Every path removes the entry from the table first, so the held connection is
 * written and closed at most once and its concurrency slot is released exactly
 * once. Must be driven from the server's serialized queue.
 */
class PermissionResponder {
 public:
  PermissionResponder(shared_ptr<SocketHandler> _socketHandler,
                      shared_ptr<PendingPermissionTable> _pendingTable,
                      shared_ptr<ConnectionLimiter> _limiter);

  void setFailureCallback(PermissionDeliveryFailedCallback callback) {
    onDeliveryFailed = callback;
  }

  /** @return true when the decision was written to the client. */
  bool respond(const string& toolUseId, PermissionDecision decision,
               const optional<string>& reason);
  /** @brief Answers the most recently received request of the session. */
  bool respondBySession(const string& sessionId, PermissionDecision decision,
                        const optional<string>& reason);

  /** @return true when a pending entry was found and closed. */
  bool cancel(const string& toolUseId);
  /** @return Number of entries closed. */
  int cancelSession(const string& sessionId);
  int cancelAll();

  /** @brief Closes an entry's connection without writing anything. */
  void discard(const PendingPermission& permission);

 protected:
  bool deliver(const PendingPermission& permission, PermissionDecision decision,
               const optional<string>& reason);

  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<PendingPermissionTable> pendingTable;
  shared_ptr<ConnectionLimiter> limiter;
  PermissionDeliveryFailedCallback onDeliveryFailed;
};
}  // namespace hr

#endif  // __HR_PERMISSION_RESPONDER__
