#include "PendingPermissionTable.hpp"

namespace hr {
PendingPermissionTable::PendingPermissionTable() : nextSequence(0) {}

optional<PendingPermission> PendingPermissionTable::insert(
    const string& sessionId, const string& toolUseId, int clientFd,
    const HookEvent& event, TimePoint receivedAt) {
  lock_guard<recursive_mutex> guard(tableMutex);
  PendingPermission entry{sessionId, toolUseId,  clientFd,
                          event,     receivedAt, nextSequence++};
  optional<PendingPermission> displaced;
  auto it = pending.find(toolUseId);
  if (it != pending.end()) {
    displaced = it->second;
    pending.erase(it);
  }
  pending.emplace(toolUseId, entry);
  return displaced;
}

optional<PendingPermission> PendingPermissionTable::removeById(
    const string& toolUseId) {
  lock_guard<recursive_mutex> guard(tableMutex);
  auto it = pending.find(toolUseId);
  if (it == pending.end()) {
    return nullopt;
  }
  PendingPermission entry = it->second;
  pending.erase(it);
  return entry;
}

map<string, PendingPermission>::const_iterator
PendingPermissionTable::findLatestForSession(const string& sessionId) const {
  auto latest = pending.end();
  for (auto it = pending.begin(); it != pending.end(); ++it) {
    if (it->second.sessionId != sessionId) {
      continue;
    }
    if (latest == pending.end() ||
        std::tie(it->second.receivedAt, it->second.sequence) >
            std::tie(latest->second.receivedAt, latest->second.sequence)) {
      latest = it;
    }
  }
  return latest;
}

optional<PendingPermission> PendingPermissionTable::removeLatestForSession(
    const string& sessionId) {
  lock_guard<recursive_mutex> guard(tableMutex);
  auto it = findLatestForSession(sessionId);
  if (it == pending.end()) {
    return nullopt;
  }
  PendingPermission entry = it->second;
  pending.erase(it);
  return entry;
}

vector<PendingPermission> PendingPermissionTable::removeAllForSession(
    const string& sessionId) {
  lock_guard<recursive_mutex> guard(tableMutex);
  vector<PendingPermission> removed;
  for (auto it = pending.begin(); it != pending.end();) {
    if (it->second.sessionId == sessionId) {
      removed.push_back(it->second);
      it = pending.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}

vector<PendingPermission> PendingPermissionTable::removeAll() {
  lock_guard<recursive_mutex> guard(tableMutex);
  vector<PendingPermission> removed;
  for (const auto& it : pending) {
    removed.push_back(it.second);
  }
  pending.clear();
  return removed;
}

bool PendingPermissionTable::hasSession(const string& sessionId) const {
  lock_guard<recursive_mutex> guard(tableMutex);
  return findLatestForSession(sessionId) != pending.end();
}

optional<PendingPermissionInfo> PendingPermissionTable::getLatestForSession(
    const string& sessionId) const {
  lock_guard<recursive_mutex> guard(tableMutex);
  auto it = findLatestForSession(sessionId);
  if (it == pending.end()) {
    return nullopt;
  }
  const HookEvent& event = it->second.event;
  return PendingPermissionInfo{event.getTool(), it->second.toolUseId,
                               event.getToolInput()};
}

bool PendingPermissionTable::contains(const string& toolUseId) const {
  lock_guard<recursive_mutex> guard(tableMutex);
  return pending.find(toolUseId) != pending.end();
}

size_t PendingPermissionTable::size() const {
  lock_guard<recursive_mutex> guard(tableMutex);
  return pending.size();
}
}  // namespace hr
