#ifndef __HR_CONSOLE_COMMAND__
#define __HR_CONSOLE_COMMAND__

#include "Headers.hpp"
#include "HookEvent.hpp"

namespace hr {
enum class ConsoleAction {
  RESPOND,
  RESPOND_SESSION,
  CANCEL,
  CANCEL_SESSION,
  PENDING,
  QUIT,
};

/** @brief One line typed into the daemon console. */
struct ConsoleCommand {
  ConsoleAction action;
  /** @brief Tool use id or session id, depending on the action. */
  string target;
  optional<PermissionDecision> decision;
  optional<string> reason;
};

extern const char* const CONSOLE_USAGE;

/**
 * @brief Parses `allow|deny|ask <id> [reason]`, `session allow|deny|ask <sid>
 * [reason]`, `cancel <id>`, `cancel-session <sid>`, `pending <sid>` and
 * `quit`. The reason is the rest of the line with surrounding whitespace
 * removed.
 * @throws std::runtime_error describing what is wrong with the line.
 */
ConsoleCommand parseConsoleCommand(const string& line);
}  // namespace hr

#endif  // __HR_CONSOLE_COMMAND__
