#include "HookEvent.hpp"

namespace hr {
const char* const STATUS_WAITING_FOR_APPROVAL = "waiting_for_approval";

namespace {
const char* const PERMISSION_REQUEST_EVENT = "PermissionRequest";
const char* const PRE_COMPACT_EVENT = "PreCompact";

string requiredString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    throw std::runtime_error(string("Missing or non-string field: ") + key);
  }
  return it->get<string>();
}

optional<string> optionalString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullopt;
  }
  if (!it->is_string()) {
    throw std::runtime_error(string("Non-string field: ") + key);
  }
  return it->get<string>();
}

template <typename T>
void setOptional(json* object, const char* key, const optional<T>& value) {
  if (value) {
    (*object)[key] = *value;
  }
}
}  // namespace

HookEventKind hookEventKindFromName(const string& name) {
  static const map<string, HookEventKind> kinds = {
      {"PreToolUse", HookEventKind::PRE_INVOCATION},
      {"PermissionRequest", HookEventKind::PERMISSION_NEEDED},
      {"UserPromptSubmit", HookEventKind::USER_INPUT_SUBMITTED},
      {"Stop", HookEventKind::IDLE},
      {"SubagentStop", HookEventKind::IDLE},
      {"PostToolUse", HookEventKind::PROCESSING},
      {"PreCompact", HookEventKind::COMPACTING},
      {"SessionStart", HookEventKind::SESSION_START},
      {"SessionEnd", HookEventKind::SESSION_END},
      {"Notification", HookEventKind::NOTIFICATION},
  };
  auto it = kinds.find(name);
  if (it == kinds.end()) {
    return HookEventKind::UNKNOWN;
  }
  return it->second;
}

string hookEventKindToString(HookEventKind kind) {
  switch (kind) {
    case HookEventKind::PRE_INVOCATION:
      return "pre-invocation";
    case HookEventKind::PERMISSION_NEEDED:
      return "permission-needed";
    case HookEventKind::USER_INPUT_SUBMITTED:
      return "user-input-submitted";
    case HookEventKind::IDLE:
      return "idle";
    case HookEventKind::PROCESSING:
      return "processing";
    case HookEventKind::COMPACTING:
      return "compacting";
    case HookEventKind::SESSION_START:
      return "session-start";
    case HookEventKind::SESSION_END:
      return "session-end";
    case HookEventKind::NOTIFICATION:
      return "notification";
    case HookEventKind::UNKNOWN:
      break;
  }
  return "unknown";
}

string sessionPhaseToString(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::IDLE:
      return "idle";
    case SessionPhase::PROCESSING:
      return "processing";
    case SessionPhase::WAITING_FOR_INPUT:
      return "waiting_for_input";
    case SessionPhase::WAITING_FOR_APPROVAL:
      return "waiting_for_approval";
    case SessionPhase::COMPACTING:
      return "compacting";
  }
  return "idle";
}

string permissionDecisionToString(PermissionDecision decision) {
  switch (decision) {
    case PermissionDecision::ALLOW:
      return "allow";
    case PermissionDecision::DENY:
      return "deny";
    case PermissionDecision::ASK:
      return "ask";
  }
  STFATAL << "Invalid decision: " << int(decision);
  return "";
}

optional<PermissionDecision> permissionDecisionFromString(const string& name) {
  if (name == "allow") {
    return PermissionDecision::ALLOW;
  }
  if (name == "deny") {
    return PermissionDecision::DENY;
  }
  if (name == "ask") {
    return PermissionDecision::ASK;
  }
  return nullopt;
}

HookEvent HookEvent::decode(const string& payload) {
  json object;
  try {
    object = json::parse(payload);
  } catch (const json::exception& e) {
    throw std::runtime_error(string("Invalid json: ") + e.what());
  }
  if (!object.is_object()) {
    throw std::runtime_error("Event payload is not a json object");
  }

  HookEvent event;
  event.sessionId = requiredString(object, "session_id");
  event.cwd = requiredString(object, "cwd");
  event.eventName = requiredString(object, "event");
  event.status = requiredString(object, "status");
  event.kind = hookEventKindFromName(event.eventName);

  auto pidIt = object.find("pid");
  if (pidIt != object.end() && !pidIt->is_null()) {
    if (!pidIt->is_number_integer()) {
      throw std::runtime_error("Non-integer field: pid");
    }
    event.pid = pidIt->get<int64_t>();
  }

  event.tty = optionalString(object, "tty");
  event.tool = optionalString(object, "tool");

  auto inputIt = object.find("tool_input");
  if (inputIt != object.end() && !inputIt->is_null()) {
    if (!inputIt->is_object()) {
      throw std::runtime_error("Non-object field: tool_input");
    }
    event.toolInput = *inputIt;
  }

  event.toolUseId = optionalString(object, "tool_use_id");
  event.notificationType = optionalString(object, "notification_type");
  event.message = optionalString(object, "message");
  return event;
}

json HookEvent::toJson() const {
  json object;
  object["session_id"] = sessionId;
  object["cwd"] = cwd;
  object["event"] = eventName;
  object["status"] = status;
  setOptional(&object, "pid", pid);
  setOptional(&object, "tty", tty);
  setOptional(&object, "tool", tool);
  setOptional(&object, "tool_input", toolInput);
  setOptional(&object, "tool_use_id", toolUseId);
  setOptional(&object, "notification_type", notificationType);
  setOptional(&object, "message", message);
  return object;
}

HookEvent HookEvent::withToolUseId(const string& id) const {
  HookEvent updated = *this;
  updated.toolUseId = id;
  return updated;
}

bool HookEvent::expectsResponse() const {
  return eventName == PERMISSION_REQUEST_EVENT &&
         status == STATUS_WAITING_FOR_APPROVAL;
}

SessionPhase HookEvent::sessionPhase() const {
  if (eventName == PRE_COMPACT_EVENT) {
    return SessionPhase::COMPACTING;
  }
  if (status == STATUS_WAITING_FOR_APPROVAL) {
    return SessionPhase::WAITING_FOR_APPROVAL;
  }
  if (status == "waiting_for_input") {
    return SessionPhase::WAITING_FOR_INPUT;
  }
  if (status == "running_tool" || status == "processing" ||
      status == "starting") {
    return SessionPhase::PROCESSING;
  }
  if (status == "compacting") {
    return SessionPhase::COMPACTING;
  }
  return SessionPhase::IDLE;
}

string encodeDecisionResponse(PermissionDecision decision,
                              const optional<string>& reason) {
  json response;
  response["decision"] = permissionDecisionToString(decision);
  if (reason) {
    response["reason"] = *reason;
  } else {
    response["reason"] = nullptr;
  }
  return response.dump();
}
}  // namespace hr
