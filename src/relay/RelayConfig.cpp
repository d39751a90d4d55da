#include "RelayConfig.hpp"

#include "SimpleIni.h"

namespace hr {
namespace {
optional<int64_t> readPositive(const CSimpleIniA& ini, const char* section,
                               const char* key) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return nullopt;
  }
  string valueStr(value);
  size_t consumed = 0;
  int64_t parsed = 0;
  try {
    parsed = std::stoll(valueStr, &consumed);
  } catch (const std::logic_error&) {
    consumed = 0;
  }
  if (consumed == 0 || consumed != valueStr.length() || parsed <= 0) {
    throw std::runtime_error(string("Invalid value for [") + section + "] " +
                             key + ": " + valueStr);
  }
  return parsed;
}

optional<int> readPositiveInt(const CSimpleIniA& ini, const char* section,
                              const char* key) {
  auto parsed = readPositive(ini, section, key);
  if (!parsed) {
    return nullopt;
  }
  if (*parsed > std::numeric_limits<int>::max()) {
    throw std::runtime_error(string("Value for [") + section + "] " + key +
                             " is out of range: " + to_string(*parsed));
  }
  return int(*parsed);
}
}  // namespace

void RelayConfig::validate() const {
  if (socketPath.empty()) {
    throw std::runtime_error("Socket path must not be empty");
  }
  if (socketPath.length() >= sizeof(sockaddr_un::sun_path)) {
    throw std::runtime_error("Socket path is too long: " + socketPath);
  }
  if (listenBacklog <= 0) {
    throw std::runtime_error("Listen backlog must be positive");
  }
  if (readTimeout.count() <= 0) {
    throw std::runtime_error("Read timeout must be positive");
  }
  if (pollInterval.count() <= 0 || pollInterval > readTimeout) {
    throw std::runtime_error(
        "Poll interval must be positive and no longer than the read timeout");
  }
  if (maxConnections <= 0 || maxConnections > MAX_CONNECTIONS_LIMIT) {
    throw std::runtime_error("Max connections must be between 1 and " +
                             to_string(MAX_CONNECTIONS_LIMIT));
  }
  if (maxPayloadBytes == 0) {
    throw std::runtime_error("Max payload size must be positive");
  }
  if (cacheEntryTtl.count() <= 0) {
    throw std::runtime_error("Cache entry TTL must be positive");
  }
  if (cacheSweepInterval.count() <= 0) {
    throw std::runtime_error("Cache sweep interval must be positive");
  }
}

void loadRelayConfigFile(const string& filename, RelayConfig* config,
                         DebugSettings* debugSettings) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }

  const char* path = ini.GetValue("Socket", "path", NULL);
  if (path) {
    config->socketPath = string(path);
  }
  if (auto backlog = readPositiveInt(ini, "Socket", "backlog")) {
    config->listenBacklog = *backlog;
  }

  if (auto maxConnections =
          readPositiveInt(ini, "Limits", "max_connections")) {
    config->maxConnections = *maxConnections;
  }
  if (auto readTimeout = readPositive(ini, "Limits", "read_timeout_ms")) {
    config->readTimeout = std::chrono::milliseconds(*readTimeout);
  }
  if (auto pollInterval = readPositive(ini, "Limits", "poll_interval_ms")) {
    config->pollInterval = std::chrono::milliseconds(*pollInterval);
  }
  if (auto maxPayload = readPositive(ini, "Limits", "max_payload_bytes")) {
    config->maxPayloadBytes = size_t(*maxPayload);
  }

  if (auto ttl = readPositive(ini, "Cache", "ttl_seconds")) {
    config->cacheEntryTtl = std::chrono::seconds(*ttl);
  }
  if (auto sweep = readPositive(ini, "Cache", "sweep_interval_seconds")) {
    config->cacheSweepInterval = std::chrono::seconds(*sweep);
  }

  if (debugSettings) {
    const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
    if (vlevel) {
      debugSettings->verbose = atoi(vlevel);
    }
    const char* silent = ini.GetValue("Debug", "silent", NULL);
    if (silent && atoi(silent) != 0) {
      debugSettings->silent = true;
    }
    const char* logsize = ini.GetValue("Debug", "logsize", NULL);
    if (logsize && atoi(logsize) != 0) {
      // make sure maxlogsize is a string of int value
      debugSettings->logsize = string(logsize);
    }
  }

  config->validate();
}
}  // namespace hr
