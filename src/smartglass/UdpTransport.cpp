#include "UdpTransport.hpp"

#include "MessageUtils.hpp"

namespace sg {
namespace {
const int RECEIVE_POLL_MS = 100;
}

UdpTransport::UdpTransport(shared_ptr<DatagramSocketHandler> _socketHandler,
                           const SocketEndpoint& _endpoint,
                           shared_ptr<CryptoContext> _cryptoContext)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      cryptoContext(_cryptoContext),
      socketFd(-1),
      shuttingDown(false) {
  socketFd = socketHandler->connect(endpoint);
  if (socketFd == -1) {
    throw TransportError("Could not open a socket to " + endpoint.getName());
  }
  readerThread = std::shared_ptr<std::thread>(
      new std::thread(&UdpTransport::pollReceive, this));
}

UdpTransport::~UdpTransport() {
  try {
    close();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Error closing transport to " << endpoint << ": "
                 << ex.what();
  }
}

void UdpTransport::send(const Envelope& envelope) {
  if (shuttingDown) {
    throw TransportError("Transport to " + endpoint.getName() + " is closed");
  }
  Packet packet(uint8_t(envelope.type()), protoToString(envelope));
  if (!isPlaintext(envelope.type())) {
    packet.encrypt(cryptoContext);
  }
  lock_guard<std::mutex> guard(writeMutex);
  socketHandler->writePacket(socketFd, packet);
}

void UdpTransport::setReceiveHandler(ReceiveHandler handler) {
  lock_guard<std::recursive_mutex> guard(handlerMutex);
  receiveHandler = handler;
}

void UdpTransport::close() {
  bool expected = false;
  if (!shuttingDown.compare_exchange_strong(expected, true)) {
    return;
  }
  LOG(INFO) << "Closing transport to " << endpoint;
  if (readerThread) {
    if (readerThread->get_id() == std::this_thread::get_id()) {
      // Closed from inside a receive handler; the loop exits on its own.
      readerThread->detach();
    } else {
      readerThread->join();
    }
    readerThread.reset();
  }
  socketHandler->close(socketFd);
  socketFd = -1;
}

bool UdpTransport::decode(Packet* packet, Envelope* envelope) {
  bool plaintext = isPlaintext(MessageType(packet->getHeader()));
  if (packet->isEncrypted()) {
    packet->decrypt(cryptoContext);
  } else if (!plaintext) {
    LOG(WARNING) << "Dropping unencrypted packet of type "
                 << int(packet->getHeader());
    return false;
  }
  *envelope = stringToProto<Envelope>(packet->getPayload());
  if (uint8_t(envelope->type()) != packet->getHeader()) {
    LOG(WARNING) << "Dropping packet whose header " << int(packet->getHeader())
                 << " disagrees with " << *envelope;
    return false;
  }
  return true;
}

void UdpTransport::pollReceive() {
  el::Helpers::setThreadName("udp-transport");
  while (!shuttingDown) {
    Envelope envelope;
    try {
      Packet packet;
      if (!socketHandler->readPacket(socketFd, &packet, RECEIVE_POLL_MS)) {
        continue;
      }
      if (!decode(&packet, &envelope)) {
        continue;
      }
    } catch (const std::runtime_error& re) {
      LOG_EVERY_N(100, WARNING) << "Dropping datagram from " << endpoint
                                << ": " << re.what();
      continue;
    }

    lock_guard<std::recursive_mutex> guard(handlerMutex);
    if (receiveHandler && !shuttingDown) {
      receiveHandler(envelope);
    }
  }
  VLOG(1) << "Reader for " << endpoint << " exiting";
}
}  // namespace sg
