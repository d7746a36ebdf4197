#ifndef __SG_UDP_SOCKET_HANDLER__
#define __SG_UDP_SOCKET_HANDLER__

#include "DatagramSocketHandler.hpp"

namespace sg {
/**
 * @brief IPv4/IPv6 datagram sockets on top of POSIX.
 */
class UdpSocketHandler : public DatagramSocketHandler {
 public:
  UdpSocketHandler();
  virtual ~UdpSocketHandler();

  virtual int connect(const SocketEndpoint& endpoint);
  virtual int listen(const SocketEndpoint& endpoint);
  virtual int getLocalPort(int fd);
  virtual bool waitForData(int fd, int timeoutMs);
  virtual ssize_t send(int fd, const void* buf, size_t count);
  virtual ssize_t sendTo(int fd, const void* buf, size_t count,
                         const SocketEndpoint& endpoint);
  virtual ssize_t receiveFrom(int fd, void* buf, size_t count,
                              SocketEndpoint* from);
  virtual void close(int fd);

 protected:
  /**
   * @brief Resolves an endpoint, returning the getaddrinfo list or NULL.
   */
  addrinfo* resolve(const SocketEndpoint& endpoint, bool passive);

  /** @brief Descriptors created by this handler and not yet closed. */
  set<int> activeSockets;
  recursive_mutex mutex;
};
}  // namespace sg

#endif  // __SG_UDP_SOCKET_HANDLER__
