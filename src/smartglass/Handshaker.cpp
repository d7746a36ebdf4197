#include "Handshaker.hpp"

namespace sg {
Handshaker::Handshaker(shared_ptr<DeviceDiscovery> _discovery,
                       TransportFactory _transportFactory,
                       const ClientConfig& _config, Sleeper _sleeper)
    : discovery(_discovery),
      transportFactory(_transportFactory),
      config(_config),
      sleeper(_sleeper) {}

ConnectRequest Handshaker::buildConnectRequest(
    const string& deviceId, const string& publicKey, const string& initVector,
    const optional<Credentials>& credentials, uint32_t* sequenceNumber) {
  ConnectRequest request;
  request.set_device_id(deviceId);
  request.set_public_key(publicKey);
  request.set_init_vector(initVector);
  if (credentials) {
    request.set_user_hash(credentials->userHash);
    request.set_authorization(credentials->authorization);
  }
  request.set_sequence_number(*sequenceNumber);
  request.set_sequence_begin(*sequenceNumber + 1);
  request.set_sequence_end(*sequenceNumber + 1);
  *sequenceNumber += 2;
  return request;
}

EstablishedSession Handshaker::connect(
    const string& addressOrHostname, const optional<Credentials>& credentials) {
  Device device = discovery->ping(addressOrHostname);
  auto cryptoContext = make_shared<CryptoContext>(device.certificate);
  auto transport = make_shared<CorrelatedTransport>(
      transportFactory(device, cryptoContext));

  const string deviceId = sole::uuid4().str();
  const string initVector = CryptoContext::generateRandomInitVector();
  uint32_t sequenceNumber = 0;
  int attempt = 0;

  try {
    ConnectResponse response = withRetries(
        [&]() {
          attempt++;
          return transport->sendAndWait<ConnectResponse>(
              CONNECT_RESPONSE, config.connectTimeout,
              [&]() {
                ConnectRequest request = buildConnectRequest(
                    deviceId, cryptoContext->getPublicKey(), initVector,
                    credentials, &sequenceNumber);
                LOG(INFO) << "Connect attempt " << attempt << " to "
                          << device.endpoint << " with sequence "
                          << request.sequence_number();
                transport->send(makeEnvelope(CONNECT_REQUEST, request));
              },
              nullptr);
        },
        config.connectRetries, sleeper);

    if (response.result() != CONNECT_SUCCESS) {
      throw ConnectionFailedError(
          "Console refused the connection: " +
          ConnectResult_Name(response.result()));
    }

    EstablishedSession session;
    session.device = device;
    session.participantId = response.participant_id();
    session.deviceId = deviceId;
    session.cryptoContext = cryptoContext;
    session.transport = transport;
    session.nextSequenceNumber = sequenceNumber;
    LOG(INFO) << "Connected to " << device.endpoint << " as participant "
              << session.participantId;
    return session;
  } catch (const TimeoutError& te) {
    transport->shutdown();
    throw ConnectionFailedError("No connect response from " +
                                addressOrHostname + " after " +
                                to_string(attempt) + " attempts");
  } catch (...) {
    transport->shutdown();
    throw;
  }
}
}  // namespace sg
