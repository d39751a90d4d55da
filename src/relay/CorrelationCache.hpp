#ifndef __HR_CORRELATION_CACHE__
#define __HR_CORRELATION_CACHE__

#include "Headers.hpp"
#include "HookEvent.hpp"

namespace hr {
/**
 * @brief Groups tool invocations that a permission request could refer to:
 * same session, same tool, same arguments.
 */
struct CorrelationKey {
  string sessionId;
  string toolName;
  /** @brief Arguments serialized with sorted keys, `{}` when absent. */
  string canonicalInput;

  static CorrelationKey fromEvent(const HookEvent& event);

  bool operator<(const CorrelationKey& other) const {
    return std::tie(sessionId, toolName, canonicalInput) <
           std::tie(other.sessionId, other.toolName, other.canonicalInput);
  }
  bool operator==(const CorrelationKey& other) const {
    return sessionId == other.sessionId && toolName == other.toolName &&
           canonicalInput == other.canonicalInput;
  }
};

/**
 * @brief Deterministic serialization of tool arguments. Logically identical
 * objects produce the same string regardless of construction order.
 */
string canonicalizeToolInput(const optional<json>& toolInput);

struct CachedInvocation {
  string toolUseId;
  TimePoint cachedAt;
};

/**
 * @brief FIFO queues of invocation ids seen on pre-invocation events, used to
 * resolve the id of a later permission request that arrives without one.
 *
 * A key never maps to an empty queue: the key is dropped as soon as its last
 * entry is popped, swept or purged.
 */
class CorrelationCache {
 public:
  CorrelationCache();

  void push(const CorrelationKey& key, const string& toolUseId, TimePoint now);
  /** @brief Removes and returns the oldest id queued under `key`. */
  optional<string> pop(const CorrelationKey& key);
  /**
   * @brief Drops every queue belonging to the session.
   * @return Number of entries removed.
   */
  int purgeSession(const string& sessionId);
  /**
   * @brief Drops entries whose age is at least `ttl`.
   * @return Number of entries removed.
   */
  int sweep(TimePoint now, Clock::duration ttl);
  void clear();

  /** @brief Total number of cached ids across all keys. */
  size_t size() const;
  size_t keyCount() const;
  size_t count(const CorrelationKey& key) const;
  size_t countForSession(const string& sessionId) const;

 protected:
  map<CorrelationKey, deque<CachedInvocation>> entries;
  mutable recursive_mutex cacheMutex;
};
}  // namespace hr

#endif  // __HR_CORRELATION_CACHE__
