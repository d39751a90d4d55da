#ifndef __HR_SOCKET_ENDPOINT__
#define __HR_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace hr {
/**
 * @brief Names a local stream endpoint: the filesystem path of a unix domain
 * socket.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name("") {}

  explicit SocketEndpoint(const string &_name) : name(_name) {}

  const string &getName() const { return name; }

 protected:
  string name;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  return os << self.getName(), os;
}
}  // namespace hr

#endif  // __HR_SOCKET_ENDPOINT__
