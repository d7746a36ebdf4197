#ifndef __SG_DEVICE_DISCOVERY__
#define __SG_DEVICE_DISCOVERY__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace sg {
/**
 * @brief Identity of a console as reported by its presence response.
 */
struct Device {
  SocketEndpoint endpoint;
  string name;
  string hardwareId;
  /** @brief Public key material used to seed the CryptoContext. */
  string certificate;
};

/**
 * @brief Finds a console by address or host name.
 */
class DeviceDiscovery {
 public:
  virtual ~DeviceDiscovery() {}

  /**
   * @brief Probes one console.
   * @throws DiscoveryError if the console does not answer or cannot be
   * resolved.
   */
  virtual Device ping(const string& addressOrHostname) = 0;
};
}  // namespace sg

#endif  // __SG_DEVICE_DISCOVERY__
