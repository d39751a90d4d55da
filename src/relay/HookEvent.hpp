#ifndef __HR_HOOK_EVENT__
#define __HR_HOOK_EVENT__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace hr {
/** @brief Lifecycle occurrences reported by the external CLI tool. */
enum class HookEventKind {
  PRE_INVOCATION,
  PERMISSION_NEEDED,
  USER_INPUT_SUBMITTED,
  IDLE,
  PROCESSING,
  COMPACTING,
  SESSION_START,
  SESSION_END,
  NOTIFICATION,
  UNKNOWN,
};

/** @brief Coarse state of a session as seen by the UI layer. */
enum class SessionPhase {
  IDLE,
  PROCESSING,
  WAITING_FOR_INPUT,
  WAITING_FOR_APPROVAL,
  COMPACTING,
};

/** @brief A human decision on a permission request. */
enum class PermissionDecision {
  ALLOW,
  DENY,
  ASK,
};

/** @brief Status string the emitter uses while a tool awaits approval. */
extern const char* const STATUS_WAITING_FOR_APPROVAL;

HookEventKind hookEventKindFromName(const string& name);
string hookEventKindToString(HookEventKind kind);
string sessionPhaseToString(SessionPhase phase);
string permissionDecisionToString(PermissionDecision decision);
/** @return nullopt when `name` is not one of allow/deny/ask. */
optional<PermissionDecision> permissionDecisionFromString(const string& name);

/**
 * @brief One lifecycle event decoded from a hook connection.
 *
 * Events are immutable once decoded; `withToolUseId` produces a corrected
 * copy when the server resolves the invocation id of a permission request.
 */
class HookEvent {
 public:
  /**
   * @brief Decodes a single JSON event object.
   * @throws std::runtime_error when the payload is not a valid event.
   */
  static HookEvent decode(const string& payload);

  /** @brief Serializes back to the wire representation. */
  json toJson() const;
  string encode() const { return toJson().dump(); }

  HookEvent withToolUseId(const string& id) const;

  bool expectsResponse() const;
  SessionPhase sessionPhase() const;

  const string& getSessionId() const { return sessionId; }
  const string& getCwd() const { return cwd; }
  /** @brief The raw `event` string as sent by the emitter. */
  const string& getEventName() const { return eventName; }
  HookEventKind getKind() const { return kind; }
  const string& getStatus() const { return status; }
  const optional<int64_t>& getPid() const { return pid; }
  const optional<string>& getTty() const { return tty; }
  const optional<string>& getTool() const { return tool; }
  /** @brief Tool arguments; always a JSON object when present. */
  const optional<json>& getToolInput() const { return toolInput; }
  const optional<string>& getToolUseId() const { return toolUseId; }
  const optional<string>& getNotificationType() const {
    return notificationType;
  }
  const optional<string>& getMessage() const { return message; }

 protected:
  HookEvent() : kind(HookEventKind::UNKNOWN) {}

  string sessionId;
  string cwd;
  string eventName;
  HookEventKind kind;
  string status;
  optional<int64_t> pid;
  optional<string> tty;
  optional<string> tool;
  optional<json> toolInput;
  optional<string> toolUseId;
  optional<string> notificationType;
  optional<string> message;
};

/**
 * @brief Builds the payload written back on a held permission connection:
 * `{"decision": "...", "reason": <string|null>}`.
 */
string encodeDecisionResponse(PermissionDecision decision,
                              const optional<string>& reason);

inline ostream& operator<<(ostream& os, const HookEvent& event) {
  os << event.getEventName() << "/" << event.getStatus() << " for "
     << shortId(event.getSessionId());
  if (event.getTool()) {
    os << " tool:" << *event.getTool();
  }
  if (event.getToolUseId()) {
    os << " id:" << shortId(*event.getToolUseId(), 12);
  }
  return os;
}
}  // namespace hr

#endif  // __HR_HOOK_EVENT__
