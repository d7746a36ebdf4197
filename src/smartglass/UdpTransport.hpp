#ifndef __SG_UDP_TRANSPORT__
#define __SG_UDP_TRANSPORT__

#include "CryptoContext.hpp"
#include "DatagramSocketHandler.hpp"
#include "RawTransport.hpp"

namespace sg {
/**
 * @brief RawTransport over one UDP socket.
 *
 * Each envelope is one datagram.  Presence and connect requests travel in
 * the clear because the console needs our public key before it can open
 * anything; everything else is sealed with the CryptoContext.  A reader
 * thread decodes datagrams and feeds the receive handler in arrival order.
 */
class UdpTransport : public RawTransport {
 public:
  /**
   * @throws TransportError if no socket can be created for the endpoint.
   */
  UdpTransport(shared_ptr<DatagramSocketHandler> _socketHandler,
               const SocketEndpoint& _endpoint,
               shared_ptr<CryptoContext> _cryptoContext);
  virtual ~UdpTransport();

  virtual void send(const Envelope& envelope);
  virtual void setReceiveHandler(ReceiveHandler handler);
  virtual void close();

  static bool isPlaintext(MessageType type) {
    return type == PRESENCE_REQUEST || type == PRESENCE_RESPONSE ||
           type == CONNECT_REQUEST;
  }

  int getSocketFd() { return socketFd; }

 protected:
  /** @brief Reader thread body. */
  void pollReceive();
  /** @brief Decodes one packet, returns false if it must be dropped. */
  bool decode(Packet* packet, Envelope* envelope);

  shared_ptr<DatagramSocketHandler> socketHandler;
  SocketEndpoint endpoint;
  shared_ptr<CryptoContext> cryptoContext;
  int socketFd;
  std::atomic<bool> shuttingDown;
  std::shared_ptr<std::thread> readerThread;
  ReceiveHandler receiveHandler;
  /** @brief Held while the receive handler runs or is replaced. */
  recursive_mutex handlerMutex;
  mutex writeMutex;
};
}  // namespace sg

#endif  // __SG_UDP_TRANSPORT__
