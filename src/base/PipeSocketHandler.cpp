#include "PipeSocketHandler.hpp"

namespace hr {
namespace {
bool fillSockaddr(const string& pipePath, sockaddr_un* addr) {
  memset(addr, 0, sizeof(sockaddr_un));
  addr->sun_family = AF_UNIX;
  if (pipePath.empty() || pipePath.length() >= sizeof(addr->sun_path)) {
    return false;
  }
  strncpy(addr->sun_path, pipePath.c_str(), sizeof(addr->sun_path) - 1);
  return true;
}
}  // namespace

PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.getName();
  sockaddr_un remote;
  if (!fillSockaddr(pipePath, &remote)) {
    LOG(WARNING) << "Invalid pipe path: " << pipePath;
    SetErrno(ENAMETOOLONG);
    return -1;
  }

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  if (sockFd == -1) {
    STERROR << "Could not create socket: " << strerror(GetErrno());
    return -1;
  }
  initSocket(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0 && localErrno != EINPROGRESS) {
    VLOG(3) << "Connection result: " << result << " (" << strerror(localErrno)
            << ")";
    ::shutdown(sockFd, SHUT_RDWR);
    FATAL_FAIL(::close(sockFd));
    sockFd = -1;
    SetErrno(localErrno);
    return sockFd;
  }

  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(sockFd, &fdset);
  timeval tv;
  tv.tv_sec = 3; /* 3 second timeout */
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting sockFd";
  select(sockFd + 1, NULL, &fdset, NULL, &tv);

  if (FD_ISSET(sockFd, &fdset)) {
    VLOG(4) << "sockFd " << sockFd << " is selected";
    int so_error;
    socklen_t len = sizeof so_error;

    FATAL_FAIL(
        ::getsockopt(sockFd, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len));

    if (so_error == 0) {
      VLOG(1) << "Connected to endpoint " << endpoint;
    } else {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << so_error << " "
                << strerror(so_error);
      FATAL_FAIL(::close(sockFd));
      sockFd = -1;
      SetErrno(so_error);
    }
  } else {
    auto localErrno = GetErrno();
    LOG(INFO) << "Error connecting to " << endpoint << ": " << localErrno << " "
              << strerror(localErrno);
    FATAL_FAIL(::close(sockFd));
    sockFd = -1;
    SetErrno(ETIMEDOUT);
  }

  if (sockFd >= 0) {
    addToActiveSockets(sockFd);
  }
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint,
                                   int backlog) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  if (!fillSockaddr(pipePath, &local)) {
    throw runtime_error("Invalid pipe path: " + pipePath);
  }

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  if (fd == -1) {
    throw runtime_error(string("Failed to create socket: ") +
                        strerror(GetErrno()));
  }
  initServerSocket(fd);
  // A previous run may have left the socket file behind.
  ::unlink(local.sun_path);

  // The socket file must never exist with group or world access.
  mode_t oldMask = ::umask(S_IRWXG | S_IRWXO);
  int bindResult = ::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un));
  auto bindErrno = GetErrno();
  ::umask(oldMask);
  if (bindResult == -1) {
    FATAL_FAIL(::close(fd));
    throw runtime_error("Failed to bind " + pipePath + ": " +
                        strerror(bindErrno));
  }
  if (::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    ::unlink(local.sun_path);
    throw runtime_error("Failed to restrict permissions on " + pipePath +
                        ": " + strerror(localErrno));
  }
  if (::listen(fd, backlog) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    ::unlink(local.sun_path);
    throw runtime_error("Failed to listen on " + pipePath + ": " +
                        strerror(localErrno));
  }

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

set<int> PipeSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  if (pipeServerSockets.find(pipePath) == pipeServerSockets.end()) {
    STFATAL << "Tried to getPipeFd on a pipe without calling listen() first: "
            << pipePath;
  }
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.getName();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    LOG(WARNING) << "Tried to stop listening to a pipe that we weren't "
                    "listening on: "
                 << pipePath;
    return;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
  if (::unlink(pipePath.c_str()) == -1 && GetErrno() != ENOENT) {
    LOG(WARNING) << "Could not remove " << pipePath << ": "
                 << strerror(GetErrno());
  }
}
}  // namespace hr
