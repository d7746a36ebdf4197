#include "ChannelMultiplexer.hpp"
#include "FakeRawTransport.hpp"
#include "TestHeaders.hpp"

using namespace sg;

namespace {
struct MultiplexerFixture {
  MultiplexerFixture() : raw(new FakeRawTransport()) {
    transport = make_shared<CorrelatedTransport>(raw);
    SessionInfo info;
    info.participantId = 31;
    info.deviceId = "device";
    session = make_shared<SessionTransport>(transport, info, 0);
    multiplexer =
        make_shared<ChannelMultiplexer>(session, chrono::milliseconds(1000));
  }

  ~MultiplexerFixture() {
    session->shutdown();
    transport->shutdown();
  }

  // Answers every channel request with `result` and `channelId`.
  void answerWith(uint32_t result, uint64_t channelId) {
    FakeRawTransport* fake = raw.get();
    raw->setResponder([=](const Envelope& envelope) {
      if (envelope.type() != START_CHANNEL_REQUEST) {
        return;
      }
      StartChannelResponse response;
      response.set_channel_request_id(
          parsePayload<StartChannelRequest>(envelope).channel_request_id());
      response.set_channel_id(channelId);
      response.set_result(result);
      fake->deliver(START_CHANNEL_RESPONSE, response);
    });
  }

  vector<StartChannelRequest> channelRequests() {
    vector<StartChannelRequest> requests;
    for (const auto& envelope : raw->getSent(START_CHANNEL_REQUEST)) {
      requests.push_back(parsePayload<StartChannelRequest>(envelope));
    }
    return requests;
  }

  shared_ptr<FakeRawTransport> raw;
  shared_ptr<CorrelatedTransport> transport;
  shared_ptr<SessionTransport> session;
  shared_ptr<ChannelMultiplexer> multiplexer;
};
}  // namespace

TEST_CASE("Accepted open yields the console's channel id",
          "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  f.answerWith(0, 7);

  auto channel = f.multiplexer->openChannel(SYSTEM_INPUT);
  REQUIRE(channel->getChannelId() == 7);

  auto requests = f.channelRequests();
  REQUIRE(requests.size() == 1);
  REQUIRE(requests[0].channel_request_id() == 1);
  REQUIRE(requests[0].service_type() == SYSTEM_INPUT);
  REQUIRE(requests[0].title_id() == 0);
}

TEST_CASE("Refused open carries the result code", "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  f.answerWith(3, 7);

  try {
    f.multiplexer->openChannel(SYSTEM_INPUT);
    FAIL("openChannel should have thrown");
  } catch (const ChannelOpenError& coe) {
    REQUIRE(coe.getResult() == 3);
  }
}

TEST_CASE("Unanswered open times out without retry", "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  f.multiplexer =
      make_shared<ChannelMultiplexer>(f.session, chrono::milliseconds(50));
  REQUIRE_THROWS_AS(f.multiplexer->openChannel(SYSTEM_MEDIA), TimeoutError);
  REQUIRE(f.channelRequests().size() == 1);
}

TEST_CASE("Request ids count up and are never reused",
          "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  f.answerWith(0, 7);
  f.multiplexer->openChannel(SYSTEM_INPUT);
  f.answerWith(1, 0);
  REQUIRE_THROWS_AS(f.multiplexer->openChannel(SYSTEM_TEXT), ChannelOpenError);
  f.answerWith(0, 9);
  f.multiplexer->openChannel(NONE, 0x3D705025);

  auto requests = f.channelRequests();
  REQUIRE(requests.size() == 3);
  for (size_t i = 0; i < requests.size(); i++) {
    REQUIRE(requests[i].channel_request_id() == i + 1);
  }
  REQUIRE(requests[2].title_id() == 0x3D705025);
  REQUIRE(requests[2].service_type() == NONE);
}

TEST_CASE("Concurrent opens do not take each other's response",
          "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  const int OPENS = 6;

  vector<uint64_t> channelIds(OPENS, 0);
  vector<std::thread> openers;
  for (int i = 0; i < OPENS; i++) {
    openers.emplace_back([&, i]() {
      try {
        channelIds[i] = f.multiplexer->openChannel(SYSTEM_INPUT)->getChannelId();
      } catch (const TimeoutError&) {
      }
    });
  }
  REQUIRE(waitUntil([&]() {
    return f.transport->getPendingWaitCount() == size_t(OPENS);
  }));

  // Answer newest first; each response echoes its request id.
  auto requests = f.channelRequests();
  REQUIRE(requests.size() == size_t(OPENS));
  for (int i = OPENS - 1; i >= 0; i--) {
    StartChannelResponse response;
    response.set_channel_request_id(requests[i].channel_request_id());
    response.set_channel_id(1000 + requests[i].channel_request_id());
    response.set_result(0);
    f.raw->deliver(START_CHANNEL_RESPONSE, response);
  }
  for (auto& t : openers) {
    t.join();
  }

  set<uint64_t> distinct(channelIds.begin(), channelIds.end());
  REQUIRE(distinct.size() == size_t(OPENS));
  for (uint64_t id : channelIds) {
    REQUIRE(id > 1000);
    REQUIRE(id <= uint64_t(1000 + OPENS));
  }
}

TEST_CASE("Channel traffic is scoped by channel id", "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  f.answerWith(0, 7);
  auto channel = f.multiplexer->openChannel(SYSTEM_INPUT);

  vector<uint64_t> seen;
  channel->addMessageHandler(
      [&](const Envelope& envelope) { seen.push_back(envelope.channel_id()); });
  f.raw->deliver(TITLE_MESSAGE, TitleMessage(), 8);
  f.raw->deliver(TITLE_MESSAGE, TitleMessage(), 7);
  f.raw->deliver(CONSOLE_STATUS, ConsoleStatus());
  REQUIRE(seen == vector<uint64_t>({7}));

  channel->send(GAMEPAD, Gamepad());
  auto gamepads = f.raw->getSent(GAMEPAD);
  REQUIRE(gamepads.size() == 1);
  REQUIRE(gamepads[0].channel_id() == 7);
  REQUIRE(gamepads[0].participant_id() == 31);

  // A wait on the channel ignores the same message type on other channels.
  FakeRawTransport* fake = f.raw.get();
  f.raw->setResponder([fake](const Envelope& envelope) {
    if (envelope.type() == TITLE_MESSAGE) {
      TitleMessage reply;
      reply.set_json("{\"channel\":8}");
      fake->deliver(TITLE_MESSAGE, reply, 8);
      reply.set_json("{\"channel\":7}");
      fake->deliver(TITLE_MESSAGE, reply, 7);
    }
  });
  auto reply = channel->sendAndWait<TitleMessage>(
      TITLE_MESSAGE, chrono::milliseconds(1000),
      [&]() { channel->send(TITLE_MESSAGE, TitleMessage()); }, nullptr);
  REQUIRE(reply.json() == "{\"channel\":7}");

  // Shutting the channel down only drops its own subscriptions.
  channel->shutdown();
  f.raw->deliver(TITLE_MESSAGE, TitleMessage(), 7);
  REQUIRE(seen == vector<uint64_t>({7, 7}));
  REQUIRE_FALSE(f.raw->isClosed());
}

TEST_CASE("A follow-up sent right behind the open response is kept",
          "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  FakeRawTransport* fake = f.raw.get();
  f.raw->setResponder([fake](const Envelope& envelope) {
    if (envelope.type() != START_CHANNEL_REQUEST) {
      return;
    }
    StartChannelResponse response;
    response.set_channel_request_id(
        parsePayload<StartChannelRequest>(envelope).channel_request_id());
    response.set_channel_id(7);
    fake->deliver(START_CHANNEL_RESPONSE, response);

    // One hello on a foreign channel, then the one for the new channel.
    AuxiliaryStream other;
    other.mutable_connection_info()->set_crypto_key("other");
    fake->deliver(AUXILIARY_STREAM, other, 8);
    AuxiliaryStream hello;
    hello.mutable_connection_info()->set_crypto_key("key");
    fake->deliver(AUXILIARY_STREAM, hello, 7);
  });

  auto start = chrono::steady_clock::now();
  OpenedChannel opened = f.multiplexer->openChannelWithFollowUp(
      NONE, 42, AUXILIARY_STREAM, chrono::milliseconds(1000));
  REQUIRE(chrono::steady_clock::now() - start < chrono::milliseconds(1000));

  REQUIRE(opened.channel->getChannelId() == 7);
  REQUIRE(opened.followUp);
  REQUIRE(opened.followUp->channel_id() == 7);
  REQUIRE(parsePayload<AuxiliaryStream>(*opened.followUp)
              .connection_info()
              .crypto_key() == "key");
  REQUIRE(f.transport->getPendingWaitCount() == 0);
}

TEST_CASE("A missing follow-up leaves the opened channel usable",
          "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  f.answerWith(0, 7);

  auto start = chrono::steady_clock::now();
  OpenedChannel opened = f.multiplexer->openChannelWithFollowUp(
      NONE, 42, AUXILIARY_STREAM, chrono::milliseconds(200));
  auto elapsed = chrono::steady_clock::now() - start;

  REQUIRE(opened.channel->getChannelId() == 7);
  REQUIRE_FALSE(opened.followUp);
  REQUIRE(elapsed >= chrono::milliseconds(200));
  REQUIRE(elapsed < chrono::milliseconds(1000));
  REQUIRE(f.transport->getPendingWaitCount() == 0);
}

TEST_CASE("A refused open drops the follow-up wait", "[ChannelMultiplexer]") {
  MultiplexerFixture f;
  f.answerWith(3, 7);

  REQUIRE_THROWS_AS(f.multiplexer->openChannelWithFollowUp(
                        NONE, 42, AUXILIARY_STREAM, chrono::milliseconds(1000)),
                    ChannelOpenError);
  REQUIRE(f.transport->getPendingWaitCount() == 0);
}
