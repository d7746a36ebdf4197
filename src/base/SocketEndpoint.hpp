#ifndef __SG_SOCKET_ENDPOINT__
#define __SG_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace sg {
/**
 * @brief Host name or address plus UDP port of a console or local socket.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  explicit SocketEndpoint(const string &_name)
      : name(_name), port(DEFAULT_DEVICE_PORT) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  bool operator==(const SocketEndpoint &other) const {
    return name == other.name && port == other.port;
  }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort();
  } else {
    return os << self.getName();
  }
}
}  // namespace sg

#endif  // __SG_SOCKET_ENDPOINT__
