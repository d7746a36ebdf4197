#include "FakeDeviceDiscovery.hpp"
#include "FakeRawTransport.hpp"
#include "Handshaker.hpp"
#include "TestHeaders.hpp"

using namespace sg;

namespace {
struct HandshakeFixture {
  HandshakeFixture()
      : discovery(new FakeDeviceDiscovery()),
        raw(new FakeRawTransport()),
        transportsCreated(0) {
    config.connectTimeout = chrono::milliseconds(50);
    factory = [this](const Device&, shared_ptr<CryptoContext>) {
      transportsCreated++;
      return raw;
    };
    sleeper = [this](chrono::milliseconds d) { slept.push_back(d); };
  }

  // Answers the n-th connect request (1-based) with `result`.
  void answerAttempt(int n, ConnectResult result, uint32_t participantId) {
    auto count = make_shared<std::atomic<int>>(0);
    FakeRawTransport* rawTransport = raw.get();
    raw->setResponder([=](const Envelope& envelope) {
      if (envelope.type() != CONNECT_REQUEST) {
        return;
      }
      if (++(*count) == n) {
        ConnectResponse response;
        response.set_result(result);
        response.set_participant_id(participantId);
        rawTransport->deliver(CONNECT_RESPONSE, response);
      }
    });
  }

  vector<ConnectRequest> connectRequests() {
    vector<ConnectRequest> requests;
    for (const auto& envelope : raw->getSent(CONNECT_REQUEST)) {
      requests.push_back(parsePayload<ConnectRequest>(envelope));
    }
    return requests;
  }

  shared_ptr<FakeDeviceDiscovery> discovery;
  shared_ptr<FakeRawTransport> raw;
  int transportsCreated;
  ClientConfig config;
  TransportFactory factory;
  vector<chrono::milliseconds> slept;
  Sleeper sleeper;
};
}  // namespace

TEST_CASE("Handshake answered on the third attempt", "[Handshaker]") {
  HandshakeFixture f;
  f.answerAttempt(3, CONNECT_SUCCESS, 31);
  Handshaker handshaker(f.discovery, f.factory, f.config, f.sleeper);

  EstablishedSession session = handshaker.connect("10.0.0.5", std::nullopt);

  REQUIRE(session.participantId == 31);
  REQUIRE(session.device.name == "FakeConsole");
  REQUIRE(session.transport);
  REQUIRE_FALSE(session.transport->isShuttingDown());
  REQUIRE(session.nextSequenceNumber == 6);
  REQUIRE(f.transportsCreated == 1);
  REQUIRE(f.slept == vector<chrono::milliseconds>({chrono::milliseconds(500),
                                                   chrono::milliseconds(500)}));

  auto requests = f.connectRequests();
  REQUIRE(requests.size() == 3);
  for (size_t i = 0; i < requests.size(); i++) {
    REQUIRE(requests[i].sequence_number() == 2 * i);
    REQUIRE(requests[i].sequence_begin() == 2 * i + 1);
    REQUIRE(requests[i].sequence_end() == 2 * i + 1);
    // One device id and init vector per connect, shared by every attempt.
    REQUIRE(requests[i].device_id() == session.deviceId);
    REQUIRE(requests[i].init_vector() == requests[0].init_vector());
    REQUIRE(requests[i].public_key() == session.cryptoContext->getPublicKey());
    REQUIRE_FALSE(requests[i].has_user_hash());
  }
  REQUIRE(requests[0].init_vector().length() == 16);
  session.transport->shutdown();
}

TEST_CASE("Every attempt timing out fails the connect", "[Handshaker]") {
  HandshakeFixture f;
  Handshaker handshaker(f.discovery, f.factory, f.config, f.sleeper);

  REQUIRE_THROWS_AS(handshaker.connect("10.0.0.5", std::nullopt),
                    ConnectionFailedError);
  REQUIRE(f.connectRequests().size() == 5);
  REQUIRE(f.slept == f.config.connectRetries);
  REQUIRE(f.raw->isClosed());
}

TEST_CASE("Unreachable console aborts before the handshake", "[Handshaker]") {
  HandshakeFixture f;
  f.discovery->reachable = false;
  Handshaker handshaker(f.discovery, f.factory, f.config, f.sleeper);

  REQUIRE_THROWS_AS(handshaker.connect("10.0.0.5", std::nullopt),
                    DiscoveryError);
  REQUIRE(f.transportsCreated == 0);
  REQUIRE(f.raw->getSent().empty());
}

TEST_CASE("Refused connection is not retried", "[Handshaker]") {
  HandshakeFixture f;
  f.answerAttempt(1, CONNECT_FAILURE_USER_AUTH_FAILED, 0);
  Handshaker handshaker(f.discovery, f.factory, f.config, f.sleeper);

  REQUIRE_THROWS_AS(handshaker.connect("10.0.0.5", std::nullopt),
                    ConnectionFailedError);
  REQUIRE(f.connectRequests().size() == 1);
  REQUIRE(f.slept.empty());
  REQUIRE(f.raw->isClosed());
}

TEST_CASE("Transport errors are not retried", "[Handshaker]") {
  HandshakeFixture f;
  f.raw->setFailSends(true);
  Handshaker handshaker(f.discovery, f.factory, f.config, f.sleeper);

  REQUIRE_THROWS_AS(handshaker.connect("10.0.0.5", std::nullopt),
                    TransportError);
  REQUIRE(f.slept.empty());
  REQUIRE(f.raw->isClosed());
}

TEST_CASE("Credentials travel in the connect request", "[Handshaker]") {
  HandshakeFixture f;
  f.answerAttempt(1, CONNECT_SUCCESS, 7);
  Handshaker handshaker(f.discovery, f.factory, f.config, f.sleeper);

  Credentials credentials;
  credentials.userHash = "uhs";
  credentials.authorization = "XBL3.0 x=uhs;token";
  EstablishedSession session = handshaker.connect("10.0.0.5", credentials);

  auto requests = f.connectRequests();
  REQUIRE(requests.size() == 1);
  REQUIRE(requests[0].user_hash() == "uhs");
  REQUIRE(requests[0].authorization() == "XBL3.0 x=uhs;token");
  REQUIRE(session.nextSequenceNumber == 2);
  session.transport->shutdown();
}

TEST_CASE("Connect request reserves a begin/end pair", "[Handshaker]") {
  uint32_t sequenceNumber = 10;
  ConnectRequest request = Handshaker::buildConnectRequest(
      "device", "key", "iv", std::nullopt, &sequenceNumber);
  REQUIRE(request.sequence_number() == 10);
  REQUIRE(request.sequence_begin() == 11);
  REQUIRE(request.sequence_end() == 11);
  REQUIRE(sequenceNumber == 12);
}

TEST_CASE("Default schedule reaches the third attempt after two windows",
          "[Handshaker][slow]") {
  HandshakeFixture f;
  f.config = ClientConfig();
  vector<chrono::steady_clock::time_point> attemptTimes;
  std::mutex timesMutex;
  FakeRawTransport* rawTransport = f.raw.get();
  f.raw->setResponder([&, rawTransport](const Envelope& envelope) {
    if (envelope.type() != CONNECT_REQUEST) {
      return;
    }
    size_t attempts;
    {
      lock_guard<std::mutex> guard(timesMutex);
      attemptTimes.push_back(chrono::steady_clock::now());
      attempts = attemptTimes.size();
    }
    if (attempts == 3) {
      ConnectResponse response;
      response.set_result(CONNECT_SUCCESS);
      response.set_participant_id(99);
      rawTransport->deliver(CONNECT_RESPONSE, response);
    }
  });
  Handshaker handshaker(f.discovery, f.factory, f.config);

  auto start = chrono::steady_clock::now();
  EstablishedSession session = handshaker.connect("10.0.0.5", std::nullopt);
  auto elapsed = chrono::steady_clock::now() - start;

  REQUIRE(session.participantId == 99);
  // Two one-second windows plus the 500ms and 500ms pauses.
  REQUIRE(elapsed >= chrono::milliseconds(3000));
  REQUIRE(elapsed < chrono::milliseconds(4500));
  REQUIRE(attemptTimes.size() == 3);
  for (size_t i = 1; i < attemptTimes.size(); i++) {
    auto gap = attemptTimes[i] - attemptTimes[i - 1];
    REQUIRE(gap >= chrono::milliseconds(1500));
    REQUIRE(gap < chrono::milliseconds(2200));
  }
  session.transport->shutdown();
}

TEST_CASE("Connect responses that do not parse are ignored", "[Handshaker]") {
  HandshakeFixture f;
  FakeRawTransport* rawTransport = f.raw.get();
  f.raw->setResponder([rawTransport](const Envelope& envelope) {
    if (envelope.type() != CONNECT_REQUEST) {
      return;
    }
    Envelope garbage;
    garbage.set_type(CONNECT_RESPONSE);
    garbage.set_payload("\xff\xff\xff");
    rawTransport->deliver(garbage);

    ConnectResponse response;
    response.set_result(CONNECT_SUCCESS);
    response.set_participant_id(44);
    rawTransport->deliver(CONNECT_RESPONSE, response);
  });
  Handshaker handshaker(f.discovery, f.factory, f.config, f.sleeper);

  EstablishedSession session = handshaker.connect("10.0.0.5", std::nullopt);
  REQUIRE(session.participantId == 44);
  REQUIRE(f.connectRequests().size() == 1);
  REQUIRE(f.slept.empty());
  session.transport->shutdown();
}

TEST_CASE("Only unparsable connect responses time out", "[Handshaker]") {
  HandshakeFixture f;
  FakeRawTransport* rawTransport = f.raw.get();
  f.raw->setResponder([rawTransport](const Envelope& envelope) {
    if (envelope.type() != CONNECT_REQUEST) {
      return;
    }
    Envelope garbage;
    garbage.set_type(CONNECT_RESPONSE);
    garbage.set_payload("\xff\xff\xff");
    rawTransport->deliver(garbage);
  });
  Handshaker handshaker(f.discovery, f.factory, f.config, f.sleeper);

  REQUIRE_THROWS_AS(handshaker.connect("10.0.0.5", std::nullopt),
                    ConnectionFailedError);
  REQUIRE(f.connectRequests().size() == 5);
  REQUIRE(f.raw->isClosed());
}
