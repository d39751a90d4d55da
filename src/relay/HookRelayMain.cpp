#include <cxxopts.hpp>

#include "ConsoleCommand.hpp"
#include "HookSocketServer.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "RelayConfig.hpp"

using namespace hr;

namespace {
volatile sig_atomic_t interrupted = 0;

void StopSignalHandler(int signum) { interrupted = signum; }

void printEvent(const HookEvent& event) {
  json line = event.toJson();
  line["phase"] = sessionPhaseToString(event.sessionPhase());
  CLOG(INFO, "stdout") << line.dump() << endl;
}

void printDeliveryFailure(const string& sessionId, const string& toolUseId) {
  json line = {{"delivery_failed",
                {{"session_id", sessionId}, {"tool_use_id", toolUseId}}}};
  CLOG(INFO, "stdout") << line.dump() << endl;
}

void printPending(HookSocketServer* server, const string& sessionId) {
  json line = {{"session_id", sessionId},
               {"pending", server->hasPendingPermission(sessionId)}};
  auto info = server->getPendingPermission(sessionId);
  if (info) {
    line["tool"] = info->toolName ? json(*info->toolName) : json(nullptr);
    line["tool_use_id"] =
        info->toolUseId ? json(*info->toolUseId) : json(nullptr);
    line["tool_input"] =
        info->toolInput ? *info->toolInput : json(nullptr);
  }
  CLOG(INFO, "stdout") << line.dump() << endl;
}

/** @return false when the console asked to quit. */
bool runCommand(HookSocketServer* server, const string& line) {
  ConsoleCommand command;
  try {
    command = parseConsoleCommand(line);
  } catch (const std::runtime_error& ex) {
    CLOG(INFO, "stdout") << ex.what() << endl << CONSOLE_USAGE << endl;
    return true;
  }

  switch (command.action) {
    case ConsoleAction::RESPOND:
      server->respondToPermission(command.target, *command.decision,
                                  command.reason);
      break;
    case ConsoleAction::RESPOND_SESSION:
      server->respondToPermissionBySession(command.target, *command.decision,
                                           command.reason);
      break;
    case ConsoleAction::CANCEL:
      server->cancelPendingPermission(command.target);
      break;
    case ConsoleAction::CANCEL_SESSION:
      server->cancelPendingPermissions(command.target);
      break;
    case ConsoleAction::PENDING:
      // Let queued events land first so the answer reflects them.
      server->flush();
      printPending(server, command.target);
      break;
    case ConsoleAction::QUIT:
      return false;
  }
  return true;
}

void runConsole(HookSocketServer* server) {
  string pending;
  bool stdinOpen = true;
  char buf[4096];
  while (!interrupted) {
    if (!stdinOpen) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      continue;
    }
    if (!waitOnSocketData(STDIN_FILENO, 0, 100000)) {
      continue;
    }
    ssize_t bytesRead = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (bytesRead <= 0) {
      if (bytesRead < 0 && GetErrno() == EINTR) {
        continue;
      }
      // Keep serving until a signal arrives.
      LOG(INFO) << "stdin closed, console disabled";
      stdinOpen = false;
      continue;
    }
    pending.append(buf, bytesRead);
    size_t newline;
    while ((newline = pending.find('\n')) != string::npos) {
      string line = pending.substr(0, newline);
      pending.erase(0, newline + 1);
      if (line.find_first_not_of(" \t\r") == string::npos) {
        continue;
      }
      if (!runCommand(server, line)) {
        return;
      }
    }
  }
  LOG(INFO) << "Got signal " << interrupted;
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  hr::HandleTerminate();

  ::signal(SIGINT, StopSignalHandler);
  ::signal(SIGTERM, StopSignalHandler);
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options(
      "hookrelayd",
      "Relays hook events from a coding assistant and holds permission "
      "requests until they are answered");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("socket", "Path of the hook socket",
         cxxopts::value<string>()->default_value(DEFAULT_SOCKET_PATH))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("max-connections", "Concurrent connection ceiling",
         cxxopts::value<int>())  //
        ("read-timeout-ms", "Per-connection read timeout",
         cxxopts::value<int>())  //
        ("cache-ttl", "Seconds a tool use id stays cached",
         cxxopts::value<int>())  //
        ("sweep-interval", "Seconds between cache sweeps",
         cxxopts::value<int>())                                        //
        ("logtostdout", "log to stdout")                               //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(
             GetTempDirectory() + "hookrelay"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "hookrelayd version " << HR_VERSION << endl;
      exit(0);
    }

    RelayConfig config;
    DebugSettings debugSettings;
    if (!result["cfgfile"].as<string>().empty()) {
      loadRelayConfigFile(result["cfgfile"].as<string>(), &config,
                          &debugSettings);
    }

    // Command line options win over the config file.
    if (result.count("socket")) {
      config.socketPath = result["socket"].as<string>();
    }
    if (result.count("max-connections")) {
      config.maxConnections = result["max-connections"].as<int>();
    }
    if (result.count("read-timeout-ms")) {
      config.readTimeout =
          std::chrono::milliseconds(result["read-timeout-ms"].as<int>());
    }
    if (result.count("cache-ttl")) {
      config.cacheEntryTtl =
          std::chrono::seconds(result["cache-ttl"].as<int>());
    }
    if (result.count("sweep-interval")) {
      config.cacheSweepInterval =
          std::chrono::seconds(result["sweep-interval"].as<int>());
    }
    config.validate();

    LogSettings logSettings = LogSettings::daemon(
        result["logdir"].as<string>(), result.count("logtostdout") > 0);
    logSettings.silent = debugSettings.silent;
    if (result.count("verbose")) {
      logSettings.verbose = result["verbose"].as<int>();
    } else {
      logSettings.verbose = debugSettings.verbose;
    }
    if (debugSettings.logsize) {
      logSettings.maxLogSize = *debugSettings.logsize;
    }
    LogHandler::apply(&defaultConf, logSettings);

    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    HookSocketServer server(socketHandler, config);
    if (!server.start(printEvent, printDeliveryFailure)) {
      CLOG(ERROR, "stdout") << "Could not listen on " << config.socketPath
                            << endl;
      return 1;
    }
    CLOG(INFO, "stdout") << "Listening on " << config.socketPath << endl;

    runConsole(&server);
    server.stop();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& ex) {
    CLOG(INFO, "stdout") << "Cannot start hookrelayd: " << ex.what()
                         << endl;
    exit(1);
  }

  LogHandler::shutdown();
  return 0;
}
