#include "UdpDeviceDiscovery.hpp"

#include "Errors.hpp"
#include "MessageUtils.hpp"

namespace sg {
UdpDeviceDiscovery::UdpDeviceDiscovery(
    shared_ptr<DatagramSocketHandler> _socketHandler, int _port,
    chrono::milliseconds _timeout)
    : socketHandler(_socketHandler), port(_port), timeout(_timeout) {}

Device UdpDeviceDiscovery::ping(const string& addressOrHostname) {
  SocketEndpoint endpoint(addressOrHostname, port);
  int fd = socketHandler->connect(endpoint);
  if (fd == -1) {
    throw DiscoveryError("Cannot resolve console " + addressOrHostname);
  }

  try {
    PresenceRequest request;
    request.set_device_type(CLIENT_DEVICE_TYPE);
    request.set_min_version(PROTOCOL_VERSION);
    request.set_max_version(PROTOCOL_VERSION);
    Envelope envelope = makeEnvelope(PRESENCE_REQUEST, request);
    VLOG(1) << "Pinging " << endpoint;
    socketHandler->writePacket(
        fd, Packet(uint8_t(PRESENCE_REQUEST), protoToString(envelope)));

    auto deadline = chrono::steady_clock::now() + timeout;
    while (true) {
      auto remaining = chrono::duration_cast<chrono::milliseconds>(
          deadline - chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        throw DiscoveryError("No presence response from " + addressOrHostname);
      }
      Packet packet;
      if (!socketHandler->readPacket(fd, &packet, int(remaining.count()))) {
        continue;
      }
      if (packet.isEncrypted() || packet.getHeader() != PRESENCE_RESPONSE) {
        VLOG(1) << "Ignoring packet " << int(packet.getHeader())
                << " while waiting for presence";
        continue;
      }
      PresenceResponse response = parsePayload<PresenceResponse>(
          stringToProto<Envelope>(packet.getPayload()));
      Device device;
      device.endpoint = endpoint;
      device.name = response.name();
      device.hardwareId = response.hardware_id();
      device.certificate = response.certificate();
      LOG(INFO) << "Found console " << device.name << " at " << endpoint;
      socketHandler->close(fd);
      return device;
    }
  } catch (const DiscoveryError& de) {
    socketHandler->close(fd);
    throw;
  } catch (const std::runtime_error& re) {
    socketHandler->close(fd);
    throw DiscoveryError(string("Presence probe failed: ") + re.what());
  }
}
}  // namespace sg
