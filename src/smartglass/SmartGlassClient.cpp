#include "SmartGlassClient.hpp"

#include "TeardownSequence.hpp"
#include "UdpDeviceDiscovery.hpp"
#include "UdpSocketHandler.hpp"
#include "UdpTransport.hpp"

namespace sg {
string escapeUriData(const string& s) {
  static const char hex[] = "0123456789ABCDEF";
  string escaped;
  for (unsigned char c : s) {
    if (isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped += char(c);
    } else {
      escaped += '%';
      escaped += hex[c >> 4];
      escaped += hex[c & 0xF];
    }
  }
  return escaped;
}

string SmartGlassClient::buildLaunchUri(uint32_t titleId,
                                        const string& launchParams) {
  char buf[32];
  snprintf(buf, sizeof(buf), "ms-xbl-%08X://default", titleId);
  string uri(buf);
  if (!trim(launchParams).empty()) {
    uri += "/" + escapeUriData(launchParams);
  }
  return uri;
}

shared_ptr<SmartGlassClient> SmartGlassClient::connect(
    const string& addressOrHostname, const ClientConfig& config) {
  shared_ptr<DatagramSocketHandler> socketHandler(new UdpSocketHandler());
  shared_ptr<DeviceDiscovery> discovery(new UdpDeviceDiscovery(
      socketHandler, config.port, config.discoveryTimeout));
  TransportFactory transportFactory =
      [socketHandler](const Device& device,
                      shared_ptr<CryptoContext> cryptoContext) {
        return shared_ptr<RawTransport>(
            new UdpTransport(socketHandler, device.endpoint, cryptoContext));
      };
  return connect(discovery, transportFactory, addressOrHostname, config);
}

shared_ptr<SmartGlassClient> SmartGlassClient::connect(
    shared_ptr<DeviceDiscovery> discovery, TransportFactory transportFactory,
    const string& addressOrHostname, const ClientConfig& config) {
  Handshaker handshaker(discovery, transportFactory, config);
  EstablishedSession established =
      handshaker.connect(addressOrHostname, config.getCredentials());
  return make_shared<SmartGlassClient>(established, config);
}

SmartGlassClient::SmartGlassClient(const EstablishedSession& established,
                                   const ClientConfig& _config)
    : device(established.device),
      participantId(established.participantId),
      deviceId(established.deviceId),
      config(_config),
      transport(established.transport),
      inputChannel([this]() {
        return make_shared<InputChannel>(
            multiplexer->openChannel(SYSTEM_INPUT));
      }),
      shutDown(false) {
  SessionInfo sessionInfo;
  sessionInfo.participantId = participantId;
  sessionInfo.deviceId = deviceId;
  session = make_shared<SessionTransport>(transport, sessionInfo,
                                          established.nextSequenceNumber);
  multiplexer = make_shared<ChannelMultiplexer>(session, config.channelTimeout);
}

SmartGlassClient::~SmartGlassClient() { shutdown(); }

void SmartGlassClient::launchTitle(uint32_t titleId,
                                   const string& launchParams,
                                   ActiveTitleLocation location) {
  TitleLaunch launch;
  launch.set_location(location);
  launch.set_uri(buildLaunchUri(titleId, launchParams));
  LOG(INFO) << "Launching " << launch.uri();
  session->send(TITLE_LAUNCH, launch);
}

void SmartGlassClient::startDvrRecording(int lastSeconds) {
  if (lastSeconds < 0) {
    throw std::invalid_argument("Cannot record a negative number of seconds: " +
                                to_string(lastSeconds));
  }
  GameDvrRecord record;
  record.set_start_time_delta(-lastSeconds);
  LOG(INFO) << "Recording the last " << lastSeconds << " seconds";
  session->send(GAME_DVR_RECORD, record);
}

shared_ptr<InputChannel> SmartGlassClient::getInputChannel() {
  if (inputChannel.isDisposed()) {
    throw std::runtime_error("Client is shut down");
  }
  return inputChannel.get();
}

shared_ptr<TitleChannel> SmartGlassClient::startTitleChannel(
    uint32_t titleId) {
  OpenedChannel opened = multiplexer->openChannelWithFollowUp(
      NONE, titleId, AUXILIARY_STREAM, config.auxHelloTimeout);

  optional<AuxiliaryStream> auxiliaryStream;
  if (opened.followUp) {
    try {
      auxiliaryStream = parsePayload<AuxiliaryStream>(*opened.followUp);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Ignoring malformed auxiliary stream hello: "
                   << re.what();
    }
  }
  return make_shared<TitleChannel>(opened.channel, auxiliaryStream);
}

void SmartGlassClient::shutdown() {
  {
    lock_guard<std::mutex> guard(shutdownMutex);
    if (shutDown) {
      return;
    }
    shutDown = true;
  }
  LOG(INFO) << "Shutting down session " << participantId;
  TeardownSequence teardown;
  teardown.add("input channel", [this]() { releaseInputChannel(); });
  teardown.add("session", [this]() { releaseSession(); });
  teardown.add("transport", [this]() { releaseTransport(); });
  int failures = teardown.run();
  if (failures) {
    LOG(WARNING) << failures << " resource(s) failed to release cleanly";
  }
}

void SmartGlassClient::releaseInputChannel() {
  auto channel = inputChannel.dispose();
  if (channel) {
    channel->shutdown();
  }
}

void SmartGlassClient::releaseSession() { session->shutdown(); }

void SmartGlassClient::releaseTransport() { transport->shutdown(); }
}  // namespace sg
