#include "PermissionResponder.hpp"

namespace hr {
PermissionResponder::PermissionResponder(
    shared_ptr<SocketHandler> _socketHandler,
    shared_ptr<PendingPermissionTable> _pendingTable,
    shared_ptr<ConnectionLimiter> _limiter)
    : socketHandler(_socketHandler),
      pendingTable(_pendingTable),
      limiter(_limiter) {}

bool PermissionResponder::respond(const string& toolUseId,
                                  PermissionDecision decision,
                                  const optional<string>& reason) {
  auto permission = pendingTable->removeById(toolUseId);
  if (!permission) {
    LOG(INFO) << "No pending permission for " << shortId(toolUseId, 12)
              << ", it may have been resolved already";
    return false;
  }
  return deliver(*permission, decision, reason);
}

bool PermissionResponder::respondBySession(const string& sessionId,
                                           PermissionDecision decision,
                                           const optional<string>& reason) {
  auto permission = pendingTable->removeLatestForSession(sessionId);
  if (!permission) {
    LOG(INFO) << "No pending permission for session " << shortId(sessionId);
    return false;
  }
  return deliver(*permission, decision, reason);
}

bool PermissionResponder::cancel(const string& toolUseId) {
  auto permission = pendingTable->removeById(toolUseId);
  if (!permission) {
    VLOG(1) << "Nothing to cancel for " << shortId(toolUseId, 12);
    return false;
  }
  LOG(INFO) << "Cancelling pending permission " << shortId(toolUseId, 12);
  discard(*permission);
  return true;
}

int PermissionResponder::cancelSession(const string& sessionId) {
  auto permissions = pendingTable->removeAllForSession(sessionId);
  for (const auto& permission : permissions) {
    discard(permission);
  }
  if (!permissions.empty()) {
    LOG(INFO) << "Cancelled " << permissions.size()
              << " pending permission(s) for session " << shortId(sessionId);
  }
  return int(permissions.size());
}

int PermissionResponder::cancelAll() {
  auto permissions = pendingTable->removeAll();
  for (const auto& permission : permissions) {
    discard(permission);
  }
  return int(permissions.size());
}

void PermissionResponder::discard(const PendingPermission& permission) {
  socketHandler->close(permission.clientFd);
  limiter->release();
}

bool PermissionResponder::deliver(const PendingPermission& permission,
                                  PermissionDecision decision,
                                  const optional<string>& reason) {
  string response = encodeDecisionResponse(decision, reason);
  int written = socketHandler->writeAllOrReturn(
      permission.clientFd, response.c_str(), response.length());
  bool delivered = (written == int(response.length()));
  discard(permission);

  if (!delivered) {
    LOG(WARNING) << "Failed to deliver " << permissionDecisionToString(decision)
                 << " for " << shortId(permission.toolUseId, 12)
                 << " (session " << shortId(permission.sessionId)
                 << "): the client is gone";
    if (onDeliveryFailed) {
      onDeliveryFailed(permission.sessionId, permission.toolUseId);
    }
    return false;
  }
  LOG(INFO) << "Delivered " << permissionDecisionToString(decision) << " for "
            << shortId(permission.toolUseId, 12);
  return true;
}
}  // namespace hr
