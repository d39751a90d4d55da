#include "HookConnectionHandler.hpp"

#define READ_BUFFER_SIZE (128 * 1024)

namespace hr {
HookConnectionHandler::HookConnectionHandler(
    shared_ptr<SocketHandler> _socketHandler,
    shared_ptr<CorrelationCache> _cache,
    shared_ptr<PendingPermissionTable> _pendingTable,
    shared_ptr<ConnectionLimiter> _limiter,
    shared_ptr<PermissionResponder> _responder, const RelayConfig& _config)
    : socketHandler(_socketHandler),
      cache(_cache),
      pendingTable(_pendingTable),
      limiter(_limiter),
      responder(_responder),
      config(_config) {}

ReadResult HookConnectionHandler::readPayload(int fd,
                                             const std::atomic<bool>& halt) {
  auto deadline = Clock::now() + config.readTimeout;
  int64_t pollMs = config.pollInterval.count();
  string payload;
  ReadEnd end = ReadEnd::TIMED_OUT;
  vector<char> buffer(READ_BUFFER_SIZE);

  while (true) {
    if (halt) {
      end = ReadEnd::HALTED;
      break;
    }
    if (Clock::now() >= deadline) {
      end = ReadEnd::TIMED_OUT;
      break;
    }
    if (!socketHandler->waitForData(fd, pollMs / 1000,
                                    (pollMs % 1000) * 1000)) {
      if (!payload.empty()) {
        // The client sent something and went quiet without closing.
        end = ReadEnd::WENT_QUIET;
        break;
      }
      continue;
    }
    ssize_t bytesRead = socketHandler->read(fd, &buffer[0], buffer.size());
    if (bytesRead > 0) {
      payload.append(&buffer[0], bytesRead);
      if (payload.length() > config.maxPayloadBytes) {
        LOG(WARNING) << "Dropping connection " << fd
                     << ": payload exceeds " << config.maxPayloadBytes
                     << " bytes";
        return ReadResult{nullopt, ReadEnd::TOO_LARGE};
      }
    } else if (bytesRead == 0) {
      end = ReadEnd::PEER_CLOSED;
      break;
    } else {
      auto localErrno = GetErrno();
      if (localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
        VLOG(1) << "Read error on " << fd << ": " << strerror(localErrno);
        end = ReadEnd::READ_ERROR;
        break;
      }
    }
  }

  if (payload.empty()) {
    switch (end) {
      case ReadEnd::PEER_CLOSED:
        VLOG(1) << "Connection " << fd << " closed without sending anything";
        break;
      case ReadEnd::TIMED_OUT:
        LOG(WARNING) << "Client read timeout after "
                     << config.readTimeout.count() << "ms";
        break;
      default:
        break;
    }
    return ReadResult{nullopt, end};
  }
  VLOG(2) << "Read " << payload.length() << " bytes from " << fd;
  return ReadResult{payload, end};
}

void HookConnectionHandler::handlePayload(int fd, const string& payload,
                                          const HookEventCallback& onEvent) {
  optional<HookEvent> decoded;
  try {
    decoded = HookEvent::decode(payload);
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Failed to parse event: " << ex.what();
    VLOG(1) << "Rejected payload: " << payload.substr(0, 512);
    closeConnection(fd);
    return;
  }
  const HookEvent& event = *decoded;
  LOG(INFO) << "Received " << event;

  switch (event.getKind()) {
    case HookEventKind::PRE_INVOCATION:
      if (event.getToolUseId()) {
        cache->push(CorrelationKey::fromEvent(event), *event.getToolUseId(),
                    Clock::now());
      }
      break;
    case HookEventKind::SESSION_END: {
      int purged = cache->purgeSession(event.getSessionId());
      VLOG(1) << "Purged " << purged << " cached id(s) for ended session "
              << shortId(event.getSessionId());
      responder->cancelSession(event.getSessionId());
      break;
    }
    case HookEventKind::PROCESSING:
      // The tool already ran, so any request still held for it was answered
      // in the terminal.
      if (event.getToolUseId() &&
          pendingTable->contains(*event.getToolUseId())) {
        responder->cancel(*event.getToolUseId());
      }
      break;
    default:
      break;
  }

  if (event.expectsResponse()) {
    handlePermissionRequest(fd, event, onEvent);
    return;
  }

  closeConnection(fd);
  if (onEvent) {
    onEvent(event);
  }
}

void HookConnectionHandler::handlePermissionRequest(
    int fd, const HookEvent& event, const HookEventCallback& onEvent) {
  optional<string> toolUseId = event.getToolUseId();
  if (!toolUseId) {
    toolUseId = cache->pop(CorrelationKey::fromEvent(event));
  }

  if (!toolUseId) {
    LOG(WARNING) << "Permission request for session "
                 << shortId(event.getSessionId())
                 << " has no tool use id and nothing cached to match it";
    closeConnection(fd);
    if (onEvent) {
      onEvent(event);
    }
    return;
  }

  HookEvent correlated =
      event.getToolUseId() ? event : event.withToolUseId(*toolUseId);
  auto displaced =
      pendingTable->insert(correlated.getSessionId(), *toolUseId, fd,
                           correlated, Clock::now());
  if (displaced) {
    LOG(WARNING) << "Replacing pending permission " << shortId(*toolUseId, 12)
                 << " with a newer request";
    responder->discard(*displaced);
  }
  LOG(INFO) << "Holding permission request " << shortId(*toolUseId, 12)
            << " for session " << shortId(correlated.getSessionId());
  if (onEvent) {
    onEvent(correlated);
  }
}

void HookConnectionHandler::closeConnection(int fd) {
  socketHandler->close(fd);
  limiter->release();
}
}  // namespace hr
