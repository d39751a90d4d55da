#ifndef __HR_PENDING_PERMISSION_TABLE__
#define __HR_PENDING_PERMISSION_TABLE__

#include "Headers.hpp"
#include "HookEvent.hpp"

namespace hr {
/**
 * @brief A permission request whose connection is held open until a decision
 * arrives.
 */
struct PendingPermission {
  string sessionId;
  string toolUseId;
  /** @brief Owned by the table while the entry exists. */
  int clientFd;
  HookEvent event;
  TimePoint receivedAt;
  /** @brief Insertion order, breaks ties between equal `receivedAt`. */
  uint64_t sequence;
};

/** @brief What the UI needs to render an approval panel. */
struct PendingPermissionInfo {
  optional<string> toolName;
  optional<string> toolUseId;
  optional<json> toolInput;
};

/**
 * @brief Pending permission requests indexed by tool use id.
 *
 * Every removal hands the entry (and with it the connection) back to the
 * caller exactly once; a second removal of the same id finds nothing.
 */
class PendingPermissionTable {
 public:
  PendingPermissionTable();

  /**
   * @brief Stores a new entry keyed by its tool use id.
   * @return The entry previously stored under the same id, which the caller
   * now owns and must close.
   */
  optional<PendingPermission> insert(const string& sessionId,
                                     const string& toolUseId, int clientFd,
                                     const HookEvent& event,
                                     TimePoint receivedAt);
  optional<PendingPermission> removeById(const string& toolUseId);
  /** @brief Removes the most recently received entry of the session. */
  optional<PendingPermission> removeLatestForSession(const string& sessionId);
  vector<PendingPermission> removeAllForSession(const string& sessionId);
  vector<PendingPermission> removeAll();

  bool hasSession(const string& sessionId) const;
  optional<PendingPermissionInfo> getLatestForSession(
      const string& sessionId) const;
  bool contains(const string& toolUseId) const;
  size_t size() const;

 protected:
  /** @brief Caller must hold tableMutex. */
  map<string, PendingPermission>::const_iterator findLatestForSession(
      const string& sessionId) const;

  map<string, PendingPermission> pending;
  uint64_t nextSequence;
  mutable recursive_mutex tableMutex;
};
}  // namespace hr

#endif  // __HR_PENDING_PERMISSION_TABLE__
