#ifndef __SG_UDP_DEVICE_DISCOVERY__
#define __SG_UDP_DEVICE_DISCOVERY__

#include "DatagramSocketHandler.hpp"
#include "DeviceDiscovery.hpp"

namespace sg {
/**
 * @brief Unicast presence probe: one PresenceRequest, one PresenceResponse.
 */
class UdpDeviceDiscovery : public DeviceDiscovery {
 public:
  UdpDeviceDiscovery(shared_ptr<DatagramSocketHandler> _socketHandler,
                     int _port, chrono::milliseconds _timeout);

  virtual Device ping(const string& addressOrHostname);

 protected:
  shared_ptr<DatagramSocketHandler> socketHandler;
  int port;
  chrono::milliseconds timeout;
};
}  // namespace sg

#endif  // __SG_UDP_DEVICE_DISCOVERY__
