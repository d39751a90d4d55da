#include "RelayConfig.hpp"
#include "TestHeaders.hpp"

using namespace hr;

namespace {
string writeConfigFile(const string& contents) {
  string pattern = GetTempDirectory() + string("hr_config_XXXXXXXX");
  int fd = mkstemp(&pattern[0]);
  FATAL_FAIL(fd);
  FATAL_FAIL(::write(fd, contents.c_str(), contents.length()));
  FATAL_FAIL(::close(fd));
  return pattern;
}
}  // namespace

TEST_CASE("defaults are valid", "[RelayConfig]") {
  RelayConfig config;
  REQUIRE(config.socketPath == "/tmp/hookrelay.sock");
  REQUIRE(config.readTimeout == std::chrono::milliseconds(5000));
  REQUIRE(config.pollInterval == std::chrono::milliseconds(50));
  REQUIRE(config.maxConnections == 10);
  REQUIRE(config.cacheEntryTtl == std::chrono::seconds(60));
  REQUIRE(config.cacheSweepInterval == std::chrono::seconds(30));
  REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("validate rejects unusable values", "[RelayConfig]") {
  RelayConfig config;
  config.maxConnections = 0;
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

  config = RelayConfig();
  config.maxConnections = MAX_CONNECTIONS_LIMIT;
  REQUIRE_NOTHROW(config.validate());
  config.maxConnections = MAX_CONNECTIONS_LIMIT + 1;
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

  config = RelayConfig();
  config.readTimeout = std::chrono::milliseconds(-1);
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

  config = RelayConfig();
  config.pollInterval = std::chrono::milliseconds(10000);
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

  config = RelayConfig();
  config.socketPath = string(200, 'x');
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

  config = RelayConfig();
  config.socketPath = "";
  REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("config file overrides defaults", "[RelayConfig]") {
  string filename = writeConfigFile(
      "[Socket]\n"
      "path = /tmp/hr-test.sock\n"
      "backlog = 4\n"
      "[Limits]\n"
      "max_connections = 3\n"
      "read_timeout_ms = 1500\n"
      "poll_interval_ms = 20\n"
      "max_payload_bytes = 65536\n"
      "[Cache]\n"
      "ttl_seconds = 90\n"
      "sweep_interval_seconds = 15\n"
      "[Debug]\n"
      "verbose = 2\n"
      "silent = 1\n"
      "logsize = 1048576\n");

  RelayConfig config;
  DebugSettings debugSettings;
  loadRelayConfigFile(filename, &config, &debugSettings);
  REQUIRE(config.socketPath == "/tmp/hr-test.sock");
  REQUIRE(config.listenBacklog == 4);
  REQUIRE(config.maxConnections == 3);
  REQUIRE(config.readTimeout == std::chrono::milliseconds(1500));
  REQUIRE(config.pollInterval == std::chrono::milliseconds(20));
  REQUIRE(config.maxPayloadBytes == 65536);
  REQUIRE(config.cacheEntryTtl == std::chrono::seconds(90));
  REQUIRE(config.cacheSweepInterval == std::chrono::seconds(15));
  REQUIRE(*debugSettings.verbose == 2);
  REQUIRE(debugSettings.silent);
  REQUIRE(*debugSettings.logsize == "1048576");
  FATAL_FAIL(::remove(filename.c_str()));
}

TEST_CASE("absent keys keep their values", "[RelayConfig]") {
  string filename = writeConfigFile("[Limits]\nmax_connections = 7\n");
  RelayConfig config;
  loadRelayConfigFile(filename, &config, NULL);
  REQUIRE(config.maxConnections == 7);
  REQUIRE(config.socketPath == DEFAULT_SOCKET_PATH);
  REQUIRE(config.cacheEntryTtl == std::chrono::seconds(60));
  FATAL_FAIL(::remove(filename.c_str()));
}

TEST_CASE("bad config values are rejected", "[RelayConfig]") {
  for (const string& contents :
       {string("[Limits]\nmax_connections = 0\n"),
        string("[Limits]\nread_timeout_ms = -5\n"),
        string("[Cache]\nttl_seconds = soon\n"),
        string("[Cache]\nsweep_interval_seconds = 10s\n")}) {
    string filename = writeConfigFile(contents);
    RelayConfig config;
    REQUIRE_THROWS_AS(loadRelayConfigFile(filename, &config, NULL),
                      std::runtime_error);
    FATAL_FAIL(::remove(filename.c_str()));
  }

  RelayConfig config;
  REQUIRE_THROWS_AS(
      loadRelayConfigFile("/nonexistent/hookrelay.ini", &config, NULL),
      std::runtime_error);
}

TEST_CASE("integer settings do not wrap around", "[RelayConfig]") {
  // 2^32 + 1 would truncate to 1 if narrowed to int.
  for (const string& contents :
       {string("[Limits]\nmax_connections = 4294967297\n"),
        string("[Socket]\nbacklog = 4294967297\n"),
        string("[Limits]\nmax_connections = 2147483648\n")}) {
    string filename = writeConfigFile(contents);
    RelayConfig config;
    REQUIRE_THROWS_AS(loadRelayConfigFile(filename, &config, NULL),
                      std::runtime_error);
    REQUIRE(config.maxConnections == 10);
    REQUIRE(config.listenBacklog == 10);
    FATAL_FAIL(::remove(filename.c_str()));
  }
}
