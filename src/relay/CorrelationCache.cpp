#include "CorrelationCache.hpp"

namespace hr {
string canonicalizeToolInput(const optional<json>& toolInput) {
  if (!toolInput || toolInput->is_null()) {
    return "{}";
  }
  // json objects are backed by an ordered map, so dump() emits sorted keys at
  // every nesting level.
  return toolInput->dump(-1, ' ', false, json::error_handler_t::replace);
}

CorrelationKey CorrelationKey::fromEvent(const HookEvent& event) {
  CorrelationKey key;
  key.sessionId = event.getSessionId();
  key.toolName = event.getTool() ? *event.getTool() : string("unknown");
  key.canonicalInput = canonicalizeToolInput(event.getToolInput());
  return key;
}

CorrelationCache::CorrelationCache() {}

void CorrelationCache::push(const CorrelationKey& key, const string& toolUseId,
                            TimePoint now) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  entries[key].push_back(CachedInvocation{toolUseId, now});
  VLOG(1) << "Cached tool_use_id for " << shortId(key.sessionId)
          << " tool:" << key.toolName << " id:" << shortId(toolUseId, 12)
          << " (queue depth " << entries[key].size() << ")";
}

optional<string> CorrelationCache::pop(const CorrelationKey& key) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  auto it = entries.find(key);
  if (it == entries.end()) {
    return nullopt;
  }
  if (it->second.empty()) {
    STFATAL << "Empty queue retained in correlation cache for "
            << key.sessionId;
  }
  string toolUseId = it->second.front().toolUseId;
  it->second.pop_front();
  if (it->second.empty()) {
    entries.erase(it);
  }
  VLOG(1) << "Retrieved cached tool_use_id for " << shortId(key.sessionId)
          << " tool:" << key.toolName << " id:" << shortId(toolUseId, 12);
  return toolUseId;
}

int CorrelationCache::purgeSession(const string& sessionId) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  int removed = 0;
  for (auto it = entries.begin(); it != entries.end();) {
    if (it->first.sessionId == sessionId) {
      removed += it->second.size();
      it = entries.erase(it);
    } else {
      ++it;
    }
  }
  if (removed) {
    VLOG(1) << "Cleaned up " << removed << " cache entries for session "
            << shortId(sessionId);
  }
  return removed;
}

int CorrelationCache::sweep(TimePoint now, Clock::duration ttl) {
  lock_guard<recursive_mutex> guard(cacheMutex);
  int removed = 0;
  for (auto it = entries.begin(); it != entries.end();) {
    auto& queue = it->second;
    auto before = queue.size();
    queue.erase(std::remove_if(queue.begin(), queue.end(),
                               [now, ttl](const CachedInvocation& entry) {
                                 return now - entry.cachedAt >= ttl;
                               }),
                queue.end());
    removed += before - queue.size();
    if (queue.empty()) {
      it = entries.erase(it);
    } else {
      ++it;
    }
  }
  if (removed) {
    VLOG(1) << "Cache cleanup: removed " << removed << " stale entries, "
            << size() << " remaining";
  }
  return removed;
}

void CorrelationCache::clear() {
  lock_guard<recursive_mutex> guard(cacheMutex);
  entries.clear();
}

size_t CorrelationCache::size() const {
  lock_guard<recursive_mutex> guard(cacheMutex);
  size_t total = 0;
  for (const auto& it : entries) {
    total += it.second.size();
  }
  return total;
}

size_t CorrelationCache::keyCount() const {
  lock_guard<recursive_mutex> guard(cacheMutex);
  return entries.size();
}

size_t CorrelationCache::count(const CorrelationKey& key) const {
  lock_guard<recursive_mutex> guard(cacheMutex);
  auto it = entries.find(key);
  return it == entries.end() ? 0 : it->second.size();
}

size_t CorrelationCache::countForSession(const string& sessionId) const {
  lock_guard<recursive_mutex> guard(cacheMutex);
  size_t total = 0;
  for (const auto& it : entries) {
    if (it.first.sessionId == sessionId) {
      total += it.second.size();
    }
  }
  return total;
}
}  // namespace hr
