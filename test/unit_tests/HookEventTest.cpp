#include "HookEvent.hpp"
#include "TestHeaders.hpp"

using namespace hr;

TEST_CASE("decode reads every field", "[HookEvent]") {
  HookEvent event = HookEvent::decode(R"({
    "session_id": "s1", "cwd": "/work", "event": "PreToolUse",
    "status": "running_tool", "pid": 4242, "tty": "/dev/ttys001",
    "tool": "Bash", "tool_input": {"cmd": "ls", "args": [1, 2]},
    "tool_use_id": "t1", "notification_type": "idle_prompt",
    "message": "hello"})");

  REQUIRE(event.getSessionId() == "s1");
  REQUIRE(event.getCwd() == "/work");
  REQUIRE(event.getEventName() == "PreToolUse");
  REQUIRE(event.getKind() == HookEventKind::PRE_INVOCATION);
  REQUIRE(event.getStatus() == "running_tool");
  REQUIRE(*event.getPid() == 4242);
  REQUIRE(*event.getTty() == "/dev/ttys001");
  REQUIRE(*event.getTool() == "Bash");
  REQUIRE((*event.getToolInput())["cmd"] == "ls");
  REQUIRE(*event.getToolUseId() == "t1");
  REQUIRE(*event.getNotificationType() == "idle_prompt");
  REQUIRE(*event.getMessage() == "hello");
}

TEST_CASE("decode treats null optional fields as absent", "[HookEvent]") {
  HookEvent event = HookEvent::decode(
      R"({"session_id":"s1","cwd":"/","event":"Stop","status":"idle",)"
      R"("tool":null,"tool_input":null,"tool_use_id":null,"pid":null})");
  REQUIRE(!event.getTool());
  REQUIRE(!event.getToolInput());
  REQUIRE(!event.getToolUseId());
  REQUIRE(!event.getPid());
  REQUIRE(event.getKind() == HookEventKind::IDLE);
}

TEST_CASE("decode rejects malformed payloads", "[HookEvent]") {
  REQUIRE_THROWS_AS(HookEvent::decode("not json"), std::runtime_error);
  REQUIRE_THROWS_AS(HookEvent::decode("[1,2,3]"), std::runtime_error);
  REQUIRE_THROWS_AS(HookEvent::decode(""), std::runtime_error);
  // Missing session_id
  REQUIRE_THROWS_AS(
      HookEvent::decode(R"({"cwd":"/","event":"Stop","status":"idle"})"),
      std::runtime_error);
  // Wrong type for a required field
  REQUIRE_THROWS_AS(HookEvent::decode(
                        R"({"session_id":7,"cwd":"/","event":"Stop",)"
                        R"("status":"idle"})"),
                    std::runtime_error);
  // tool_input must be an object
  REQUIRE_THROWS_AS(HookEvent::decode(
                        R"({"session_id":"s","cwd":"/","event":"PreToolUse",)"
                        R"("status":"x","tool_input":"ls"})"),
                    std::runtime_error);
  REQUIRE_THROWS_AS(HookEvent::decode(
                        R"({"session_id":"s","cwd":"/","event":"Stop",)"
                        R"("status":"idle","pid":"12"})"),
                    std::runtime_error);
}

TEST_CASE("event names map to kinds", "[HookEvent]") {
  REQUIRE(hookEventKindFromName("PreToolUse") == HookEventKind::PRE_INVOCATION);
  REQUIRE(hookEventKindFromName("PermissionRequest") ==
          HookEventKind::PERMISSION_NEEDED);
  REQUIRE(hookEventKindFromName("UserPromptSubmit") ==
          HookEventKind::USER_INPUT_SUBMITTED);
  REQUIRE(hookEventKindFromName("Stop") == HookEventKind::IDLE);
  REQUIRE(hookEventKindFromName("SubagentStop") == HookEventKind::IDLE);
  REQUIRE(hookEventKindFromName("PostToolUse") == HookEventKind::PROCESSING);
  REQUIRE(hookEventKindFromName("PreCompact") == HookEventKind::COMPACTING);
  REQUIRE(hookEventKindFromName("SessionStart") ==
          HookEventKind::SESSION_START);
  REQUIRE(hookEventKindFromName("SessionEnd") == HookEventKind::SESSION_END);
  REQUIRE(hookEventKindFromName("Notification") ==
          HookEventKind::NOTIFICATION);
  REQUIRE(hookEventKindFromName("SomethingNew") == HookEventKind::UNKNOWN);

  // Unknown names still decode.
  HookEvent event = HookEvent::decode(
      R"({"session_id":"s","cwd":"/","event":"SomethingNew","status":"x"})");
  REQUIRE(event.getKind() == HookEventKind::UNKNOWN);
  REQUIRE(hookEventKindToString(event.getKind()) == "unknown");
}

TEST_CASE("only waiting permission requests expect a response",
          "[HookEvent]") {
  auto waiting = HookEvent::decode(
      R"({"session_id":"s","cwd":"/","event":"PermissionRequest",)"
      R"("status":"waiting_for_approval"})");
  REQUIRE(waiting.expectsResponse());

  auto otherStatus = HookEvent::decode(
      R"({"session_id":"s","cwd":"/","event":"PermissionRequest",)"
      R"("status":"processing"})");
  REQUIRE(!otherStatus.expectsResponse());

  auto otherEvent = HookEvent::decode(
      R"({"session_id":"s","cwd":"/","event":"Notification",)"
      R"("status":"waiting_for_approval"})");
  REQUIRE(!otherEvent.expectsResponse());
}

TEST_CASE("session phase follows status and compaction", "[HookEvent]") {
  auto phaseOf = [](const string& eventName, const string& status) {
    json object = {{"session_id", "s"},
                   {"cwd", "/"},
                   {"event", eventName},
                   {"status", status}};
    return HookEvent::decode(object.dump()).sessionPhase();
  };
  REQUIRE(phaseOf("PreCompact", "idle") == SessionPhase::COMPACTING);
  REQUIRE(phaseOf("PermissionRequest", "waiting_for_approval") ==
          SessionPhase::WAITING_FOR_APPROVAL);
  REQUIRE(phaseOf("Stop", "waiting_for_input") ==
          SessionPhase::WAITING_FOR_INPUT);
  REQUIRE(phaseOf("PreToolUse", "running_tool") == SessionPhase::PROCESSING);
  REQUIRE(phaseOf("UserPromptSubmit", "processing") ==
          SessionPhase::PROCESSING);
  REQUIRE(phaseOf("SessionStart", "starting") == SessionPhase::PROCESSING);
  REQUIRE(phaseOf("Notification", "compacting") == SessionPhase::COMPACTING);
  REQUIRE(phaseOf("SessionEnd", "ended") == SessionPhase::IDLE);
  REQUIRE(sessionPhaseToString(SessionPhase::WAITING_FOR_APPROVAL) ==
          "waiting_for_approval");
}

TEST_CASE("withToolUseId leaves the original untouched", "[HookEvent]") {
  auto request = HookEvent::decode(
      R"({"session_id":"s","cwd":"/","event":"PermissionRequest",)"
      R"("status":"waiting_for_approval","tool":"Bash"})");
  auto correlated = request.withToolUseId("t9");
  REQUIRE(!request.getToolUseId());
  REQUIRE(*correlated.getToolUseId() == "t9");
  REQUIRE(*correlated.getTool() == "Bash");
  REQUIRE(correlated.toJson()["tool_use_id"] == "t9");
  REQUIRE(request.toJson().count("tool_use_id") == 0);
}

TEST_CASE("decision response encoding", "[HookEvent]") {
  REQUIRE(encodeDecisionResponse(PermissionDecision::ALLOW, nullopt) ==
          R"({"decision":"allow","reason":null})");
  REQUIRE(encodeDecisionResponse(PermissionDecision::DENY,
                                 string("not in this repo")) ==
          R"({"decision":"deny","reason":"not in this repo"})");
  REQUIRE(json::parse(encodeDecisionResponse(PermissionDecision::ASK,
                                             nullopt))["decision"] == "ask");

  REQUIRE(permissionDecisionFromString("allow") == PermissionDecision::ALLOW);
  REQUIRE(permissionDecisionFromString("deny") == PermissionDecision::DENY);
  REQUIRE(permissionDecisionFromString("ask") == PermissionDecision::ASK);
  REQUIRE(!permissionDecisionFromString("maybe"));
}
