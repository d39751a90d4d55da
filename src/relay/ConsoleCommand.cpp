#include "ConsoleCommand.hpp"

namespace hr {
const char* const CONSOLE_USAGE =
    "Commands:\n"
    "  allow|deny|ask <tool_use_id> [reason]\n"
    "  session allow|deny|ask <session_id> [reason]\n"
    "  cancel <tool_use_id>\n"
    "  cancel-session <session_id>\n"
    "  pending <session_id>\n"
    "  quit";

namespace {
string trim(const string& s) {
  const char* whitespace = " \t\r\n";
  auto begin = s.find_first_not_of(whitespace);
  if (begin == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(whitespace);
  return s.substr(begin, end - begin + 1);
}

string nextToken(istringstream* stream) {
  string token;
  *stream >> token;
  return token;
}

optional<string> restOfLine(istringstream* stream) {
  string rest;
  std::getline(*stream, rest);
  rest = trim(rest);
  if (rest.empty()) {
    return nullopt;
  }
  return rest;
}

void expectNoMore(istringstream* stream, const string& command) {
  if (restOfLine(stream)) {
    throw std::runtime_error("Too many arguments to " + command);
  }
}

ConsoleCommand parseDecision(const string& verb, istringstream* stream,
                             ConsoleAction action) {
  ConsoleCommand command;
  command.action = action;
  command.decision = permissionDecisionFromString(verb);
  if (!command.decision) {
    throw std::runtime_error("Unknown decision: " + verb);
  }
  command.target = nextToken(stream);
  if (command.target.empty()) {
    throw std::runtime_error("Missing target for " + verb);
  }
  command.reason = restOfLine(stream);
  return command;
}
}  // namespace

ConsoleCommand parseConsoleCommand(const string& line) {
  istringstream stream(line);
  string verb = nextToken(&stream);
  if (verb.empty()) {
    throw std::runtime_error("Empty command");
  }

  if (verb == "session") {
    string decision = nextToken(&stream);
    if (decision.empty()) {
      throw std::runtime_error("Missing decision for session");
    }
    return parseDecision(decision, &stream, ConsoleAction::RESPOND_SESSION);
  }
  if (permissionDecisionFromString(verb)) {
    return parseDecision(verb, &stream, ConsoleAction::RESPOND);
  }

  ConsoleCommand command;
  if (verb == "quit") {
    command.action = ConsoleAction::QUIT;
    expectNoMore(&stream, verb);
    return command;
  }
  if (verb == "cancel") {
    command.action = ConsoleAction::CANCEL;
  } else if (verb == "cancel-session") {
    command.action = ConsoleAction::CANCEL_SESSION;
  } else if (verb == "pending") {
    command.action = ConsoleAction::PENDING;
  } else {
    throw std::runtime_error("Unknown command: " + verb);
  }
  command.target = nextToken(&stream);
  if (command.target.empty()) {
    throw std::runtime_error("Missing target for " + verb);
  }
  expectNoMore(&stream, verb);
  return command;
}
}  // namespace hr
