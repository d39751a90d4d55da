#include <cxxopts.hpp>

#include "HookClient.hpp"
#include "HookEvent.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "RelayConfig.hpp"

using namespace hr;

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  hr::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options(
      "hookrelay-emit",
      "Sends one hook event read from stdin to hookrelayd and prints the "
      "decision for permission requests");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("socket", "Path of the hook socket",
         cxxopts::value<string>()->default_value(DEFAULT_SOCKET_PATH))  //
        ("timeout-ms",
         "Give up waiting for a decision after this long (0 waits forever)",
         cxxopts::value<int>()->default_value("0"))  //
        ("logdir", "Write logs to this directory (disabled by default)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "hookrelay-emit version " << HR_VERSION << endl;
      exit(0);
    }

    LogSettings logSettings =
        LogSettings::emitter(result["logdir"].as<string>());
    if (result.count("verbose")) {
      logSettings.verbose = result["verbose"].as<int>();
    }
    LogHandler::apply(&defaultConf, logSettings);

    string payload((std::istreambuf_iterator<char>(cin)),
                   std::istreambuf_iterator<char>());

    bool expectsResponse = false;
    try {
      expectsResponse = HookEvent::decode(payload).expectsResponse();
    } catch (const std::runtime_error& ex) {
      LOG(WARNING) << "Not a hook event, dropping it: " << ex.what();
      return 0;
    }

    shared_ptr<SocketHandler> socketHandler(new PipeSocketHandler());
    HookClient client(socketHandler,
                      SocketEndpoint(result["socket"].as<string>()));
    if (!client.connect()) {
      // Nobody is listening; the assistant must not be held up by that.
      LOG(INFO) << "hookrelayd is not running";
      return 0;
    }
    client.send(payload);

    if (!expectsResponse) {
      return 0;
    }
    int timeoutMs = result["timeout-ms"].as<int>();
    auto start = Clock::now();
    while (true) {
      auto response = client.readResponse(1000);
      if (response) {
        if (!response->empty()) {
          CLOG(INFO, "stdout") << *response << endl;
        }
        break;
      }
      if (timeoutMs > 0 && Clock::now() - start >=
                               std::chrono::milliseconds(timeoutMs)) {
        LOG(INFO) << "Gave up waiting for a decision";
        break;
      }
    }
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Could not deliver the hook event: " << ex.what();
  }
  return 0;
}
