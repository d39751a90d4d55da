#include "HookSocketServer.hpp"

namespace hr {
HookSocketServer::HookSocketServer(shared_ptr<SocketHandler> _socketHandler,
                                   const RelayConfig& _config)
    : socketHandler(_socketHandler),
      config(_config),
      endpoint(_config.socketPath),
      cache(new CorrelationCache()),
      pendingTable(new PendingPermissionTable()),
      limiter(new ConnectionLimiter(_config.maxConnections)),
      responder(new PermissionResponder(_socketHandler, pendingTable, limiter)),
      connectionHandler(new HookConnectionHandler(
          _socketHandler, cache, pendingTable, limiter, responder, _config)),
      housekeeper(_config.cacheSweepInterval, [this]() { sweepCache(); }),
      running(false),
      halt(false) {}

HookSocketServer::~HookSocketServer() { stop(); }

bool HookSocketServer::start(
    HookEventCallback _onEvent,
    PermissionDeliveryFailedCallback onPermissionFailure) {
  lock_guard<mutex> lifecycleGuard(lifecycleMutex);
  if (running) {
    LOG(WARNING) << "Hook socket server is already running on " << endpoint;
    return true;
  }

  try {
    config.validate();
    socketHandler->listen(endpoint, config.listenBacklog);
  } catch (const std::runtime_error& ex) {
    STERROR << "Could not start the hook socket server on " << endpoint << ": "
            << ex.what();
    return false;
  }

  {
    lock_guard<recursive_mutex> guard(serverMutex);
    onEvent = _onEvent;
    responder->setFailureCallback(onPermissionFailure);
    readerPool.reset(new ThreadPool(config.maxConnections));
    stateQueue.reset(new ThreadPool(1));
  }
  halt = false;
  running = true;
  acceptThread.reset(new std::thread(&HookSocketServer::run, this));
  housekeeper.start();
  LOG(INFO) << "Hook socket server listening on " << endpoint;
  return true;
}

void HookSocketServer::stop() {
  lock_guard<mutex> lifecycleGuard(lifecycleMutex);
  if (!running) {
    return;
  }
  LOG(INFO) << "Stopping hook socket server";
  running = false;
  halt = true;
  if (acceptThread) {
    acceptThread->join();
    acceptThread.reset();
  }
  housekeeper.stop();
  socketHandler->stopListening(endpoint);

  // Readers notice halt within one poll interval and close their connections.
  std::unique_ptr<ThreadPool> readers;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    readers = std::move(readerPool);
  }
  readers.reset();

  enqueueStateTask([this]() {
    int cancelled = responder->cancelAll();
    cache->clear();
    if (cancelled > 0) {
      LOG(INFO) << "Closed " << cancelled << " pending permission(s)";
    }
  });

  // Destroyed outside serverMutex: queued tasks may still call back into us.
  std::unique_ptr<ThreadPool> queue;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    queue = std::move(stateQueue);
  }
  queue.reset();
  LOG(INFO) << "Hook socket server stopped";
}

void HookSocketServer::respondToPermission(const string& toolUseId,
                                           PermissionDecision decision,
                                           const optional<string>& reason) {
  if (!enqueueStateTask([this, toolUseId, decision, reason]() {
        responder->respond(toolUseId, decision, reason);
      })) {
    LOG(WARNING) << "Cannot respond to " << shortId(toolUseId, 12)
                 << ": server is not running";
  }
}

void HookSocketServer::respondToPermissionBySession(
    const string& sessionId, PermissionDecision decision,
    const optional<string>& reason) {
  if (!enqueueStateTask([this, sessionId, decision, reason]() {
        responder->respondBySession(sessionId, decision, reason);
      })) {
    LOG(WARNING) << "Cannot respond to session " << shortId(sessionId)
                 << ": server is not running";
  }
}

void HookSocketServer::cancelPendingPermission(const string& toolUseId) {
  enqueueStateTask([this, toolUseId]() { responder->cancel(toolUseId); });
}

void HookSocketServer::cancelPendingPermissions(const string& sessionId) {
  enqueueStateTask(
      [this, sessionId]() { responder->cancelSession(sessionId); });
}

bool HookSocketServer::hasPendingPermission(const string& sessionId) const {
  return pendingTable->hasSession(sessionId);
}

optional<PendingPermissionInfo> HookSocketServer::getPendingPermission(
    const string& sessionId) const {
  return pendingTable->getLatestForSession(sessionId);
}

void HookSocketServer::flush() {
  std::future<void> done;
  {
    lock_guard<recursive_mutex> guard(serverMutex);
    if (!stateQueue) {
      return;
    }
    done = stateQueue->enqueue([]() {});
  }
  done.wait();
}

void HookSocketServer::run() {
  el::Helpers::setThreadName("hook-accept");
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> listenFds = socketHandler->getEndpointFds(endpoint);
  for (int i : listenFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (!halt) {
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1) {
      if (GetErrno() == EINTR) {
        continue;
      }
      STERROR << "select() on the hook socket failed: " << strerror(GetErrno());
      break;
    }
    if (numFdsSet == 0) {
      continue;
    }

    for (int i : listenFds) {
      if (FD_ISSET(i, &rfds)) {
        acceptNewConnection(i);
      }
    }
  }
  VLOG(1) << "Accept loop exited";
}

void HookSocketServer::acceptNewConnection(int listenFd) {
  int clientFd = socketHandler->accept(listenFd);
  if (clientFd < 0) {
    return;
  }
  if (!limiter->tryAcquire()) {
    socketHandler->close(clientFd);
    return;
  }
  VLOG(1) << "Accepted hook connection " << clientFd << " ("
          << limiter->getActive() << " active)";

  lock_guard<recursive_mutex> guard(serverMutex);
  if (!readerPool) {
    connectionHandler->closeConnection(clientFd);
    return;
  }
  readerPool->enqueue([this, clientFd]() { readConnection(clientFd); });
}

void HookSocketServer::readConnection(int fd) {
  el::Helpers::setThreadName("hook-reader");
  optional<string> payload;
  try {
    payload = connectionHandler->readPayload(fd, halt).payload;
  } catch (const std::exception& ex) {
    STERROR << "Error reading hook connection " << fd << ": " << ex.what();
  }
  if (!payload || halt) {
    connectionHandler->closeConnection(fd);
    return;
  }

  string data = *payload;
  if (!enqueueStateTask([this, fd, data]() {
        connectionHandler->handlePayload(fd, data, onEvent);
      })) {
    connectionHandler->closeConnection(fd);
  }
}

void HookSocketServer::sweepCache() {
  enqueueStateTask([this]() {
    int removed = cache->sweep(Clock::now(), config.cacheEntryTtl);
    if (removed > 0) {
      LOG(INFO) << "Expired " << removed << " cached tool use id(s)";
    }
  });
}

bool HookSocketServer::enqueueStateTask(std::function<void()> task) {
  lock_guard<recursive_mutex> guard(serverMutex);
  if (!stateQueue) {
    VLOG(1) << "Hook socket server is not running, dropping task";
    return false;
  }
  // The returned future is discarded, so the task must not throw.
  stateQueue->enqueue([task]() {
    el::Helpers::setThreadName("hook-state");
    try {
      task();
    } catch (const std::exception& ex) {
      STERROR << "Hook server task failed: " << ex.what();
    }
  });
  return true;
}
}  // namespace hr
