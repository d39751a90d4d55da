#ifndef __HR_RELAY_CONFIG__
#define __HR_RELAY_CONFIG__

#include "Headers.hpp"

namespace hr {
const string DEFAULT_SOCKET_PATH = "/tmp/hookrelay.sock";
/**
 * @brief Largest accepted connection ceiling. The server keeps one reader
 * thread per slot.
 */
const int MAX_CONNECTIONS_LIMIT = 256;

/** @brief Tunables of the hook socket server. */
struct RelayConfig {
  string socketPath = DEFAULT_SOCKET_PATH;
  int listenBacklog = 10;
  /** @brief Upper bound on how long one connection may take to send. */
  std::chrono::milliseconds readTimeout = std::chrono::milliseconds(5000);
  /** @brief A connection that stays quiet this long after sending is done. */
  std::chrono::milliseconds pollInterval = std::chrono::milliseconds(50);
  /** @brief Between 1 and MAX_CONNECTIONS_LIMIT. */
  int maxConnections = 10;
  size_t maxPayloadBytes = 4 * 1024 * 1024;
  std::chrono::seconds cacheEntryTtl = std::chrono::seconds(60);
  std::chrono::seconds cacheSweepInterval = std::chrono::seconds(30);

  /** @throws std::runtime_error naming the first invalid setting. */
  void validate() const;
};

/** @brief Settings from the `[Debug]` section, consumed by the daemon. */
struct DebugSettings {
  optional<int> verbose;
  bool silent = false;
  optional<string> logsize;
};

/**
 * @brief Applies an INI file on top of `config`.
 *
 * Recognized keys: `[Socket] path, backlog`, `[Limits] max_connections,
 * read_timeout_ms, poll_interval_ms, max_payload_bytes`, `[Cache]
 * ttl_seconds, sweep_interval_seconds`, `[Debug] verbose, silent, logsize`.
 * Keys that are absent keep their current value.
 *
 * @throws std::runtime_error when the file cannot be loaded or a value is not
 * a positive integer.
 */
void loadRelayConfigFile(const string& filename, RelayConfig* config,
                         DebugSettings* debugSettings);
}  // namespace hr

#endif  // __HR_RELAY_CONFIG__
