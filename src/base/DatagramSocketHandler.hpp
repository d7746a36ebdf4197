#ifndef __SG_DATAGRAM_SOCKET_HANDLER__
#define __SG_DATAGRAM_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"
#include "SocketEndpoint.hpp"

namespace sg {
/**
 * @brief Abstract API for datagram sockets so transports can be tested
 * without a network.
 */
class DatagramSocketHandler {
 public:
  virtual ~DatagramSocketHandler() {}

  /**
   * @brief Creates a socket whose default peer is `endpoint`.
   * @return The descriptor or -1 if the name does not resolve.
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Creates a socket bound to `endpoint` (port 0 picks one).
   * @return The descriptor or -1 on failure.
   */
  virtual int listen(const SocketEndpoint& endpoint) = 0;
  /** @brief Local port a descriptor is bound to. */
  virtual int getLocalPort(int fd) = 0;

  /**
   * @brief Blocks up to `timeoutMs` for a datagram to become readable.
   */
  virtual bool waitForData(int fd, int timeoutMs) = 0;
  /** @brief Sends one datagram to the connected peer. */
  virtual ssize_t send(int fd, const void* buf, size_t count) = 0;
  /** @brief Sends one datagram to an explicit peer. */
  virtual ssize_t sendTo(int fd, const void* buf, size_t count,
                         const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Receives one datagram, filling `from` with the sender when set.
   */
  virtual ssize_t receiveFrom(int fd, void* buf, size_t count,
                              SocketEndpoint* from) = 0;
  virtual void close(int fd) = 0;

  /**
   * @brief Writes a packet as a single datagram.
   * @throws TransportError when the datagram cannot be sent.
   */
  inline void writePacket(int fd, const Packet& packet) {
    string s = packet.serialize();
    if (s.length() > MAX_DATAGRAM_SIZE) {
      STFATAL << "Invalid packet length: " << s.length();
    }
    ssize_t rc = send(fd, &s[0], s.length());
    if (rc != ssize_t(s.length())) {
      throw TransportError(string("Failed to send datagram: ") +
                           strerror(GetErrno()));
    }
  }

  /**
   * @brief Waits up to `timeoutMs` and reads one packet.
   * @return false if nothing arrived in time.
   * @throws TransportError on a socket error or a truncated datagram.
   */
  inline bool readPacket(int fd, Packet* packet, int timeoutMs) {
    if (!waitForData(fd, timeoutMs)) {
      return false;
    }
    string s(MAX_DATAGRAM_SIZE, '\0');
    ssize_t rc = receiveFrom(fd, &s[0], s.length(), NULL);
    if (rc < 0) {
      if (GetErrno() == EAGAIN || GetErrno() == EWOULDBLOCK ||
          GetErrno() == EINTR) {
        return false;
      }
      throw TransportError(string("Failed to receive datagram: ") +
                           strerror(GetErrno()));
    }
    s.resize(rc);
    *packet = Packet(s);
    return true;
  }

  static const size_t MAX_DATAGRAM_SIZE = 64 * 1024;
};
}  // namespace sg

#endif  // __SG_DATAGRAM_SOCKET_HANDLER__
