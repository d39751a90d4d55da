#include "HookClient.hpp"

namespace hr {
HookClient::HookClient(shared_ptr<SocketHandler> _socketHandler,
                       const SocketEndpoint& _endpoint)
    : socketHandler(_socketHandler), endpoint(_endpoint), socketFd(-1) {}

HookClient::~HookClient() { close(); }

bool HookClient::connect() {
  if (socketFd >= 0) {
    return true;
  }
  socketFd = socketHandler->connect(endpoint);
  if (socketFd < 0) {
    VLOG(1) << "Could not connect to " << endpoint << ": "
            << strerror(GetErrno());
    return false;
  }
  return true;
}

void HookClient::send(const string& payload) {
  if (socketFd < 0) {
    throw std::runtime_error("Tried to send on a closed hook connection");
  }
  socketHandler->writeAllOrThrow(socketFd, payload.c_str(), payload.length(),
                                 true);
  socketHandler->shutdownWrite(socketFd);
}

optional<string> HookClient::readResponse(int64_t timeoutMs) {
  if (socketFd < 0) {
    throw std::runtime_error("Tried to read on a closed hook connection");
  }
  try {
    return socketHandler->readUntilEof(socketFd, timeoutMs);
  } catch (const std::runtime_error& ex) {
    // A reset means the server dropped us without a decision.
    LOG(INFO) << "Hook connection reset: " << ex.what();
    return string();
  }
}

void HookClient::close() {
  if (socketFd >= 0) {
    socketHandler->close(socketFd);
    socketFd = -1;
  }
}
}  // namespace hr
