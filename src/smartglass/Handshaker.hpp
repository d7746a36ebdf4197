#ifndef __SG_HANDSHAKER__
#define __SG_HANDSHAKER__

#include "ClientConfig.hpp"
#include "CorrelatedTransport.hpp"
#include "CryptoContext.hpp"
#include "DeviceDiscovery.hpp"
#include "RetryUtils.hpp"

namespace sg {
typedef std::function<shared_ptr<RawTransport>(const Device&,
                                               shared_ptr<CryptoContext>)>
    TransportFactory;

/**
 * @brief Everything the handshake produced, handed over to the client.
 */
struct EstablishedSession {
  Device device;
  uint32_t participantId;
  /** @brief Locally generated id the console knows this client by. */
  string deviceId;
  shared_ptr<CryptoContext> cryptoContext;
  /** @brief The transport the handshake ran on, kept for the session. */
  shared_ptr<CorrelatedTransport> transport;
  /** @brief First sequence number after the handshake's reserved ones. */
  uint32_t nextSequenceNumber;
};

/**
 * @brief Runs discovery and the connect request/response exchange.
 *
 * The init vector and device id are generated once per connect() and reused
 * by every attempt.  Each attempt rebuilds the request with the sequence
 * counter advanced by two.  Only timeouts are retried, following the
 * configured backoff schedule.
 */
class Handshaker {
 public:
  Handshaker(shared_ptr<DeviceDiscovery> _discovery,
             TransportFactory _transportFactory, const ClientConfig& _config,
             Sleeper _sleeper = sleepFor);

  /**
   * @throws DiscoveryError when the console cannot be found.
   * @throws ConnectionFailedError when every attempt timed out or the
   * console refused the connection.
   */
  EstablishedSession connect(const string& addressOrHostname,
                             const optional<Credentials>& credentials);

  /**
   * @brief Builds the request for the attempt using `*sequenceNumber` and
   * advances it by two.
   */
  static ConnectRequest buildConnectRequest(
      const string& deviceId, const string& publicKey, const string& initVector,
      const optional<Credentials>& credentials, uint32_t* sequenceNumber);

 protected:
  shared_ptr<DeviceDiscovery> discovery;
  TransportFactory transportFactory;
  ClientConfig config;
  Sleeper sleeper;
};
}  // namespace sg

#endif  // __SG_HANDSHAKER__
