#include "ChannelMultiplexer.hpp"

namespace sg {
ChannelMultiplexer::ChannelMultiplexer(shared_ptr<SessionTransport> _session,
                                       chrono::milliseconds _openTimeout)
    : session(_session), openTimeout(_openTimeout), nextChannelRequestId(1) {}

shared_ptr<ChannelTransport> ChannelMultiplexer::openChannel(
    ServiceType serviceType, uint32_t titleId) {
  uint64_t channelId = startChannel(serviceType, titleId, nullptr);
  return make_shared<ChannelTransport>(channelId, session);
}

OpenedChannel ChannelMultiplexer::openChannelWithFollowUp(
    ServiceType serviceType, uint32_t titleId, MessageType followUpType,
    chrono::milliseconds followUpTimeout) {
  // Matchers run one at a time under the transport lock in arrival order, so
  // the id is set before the envelope after the response is looked at.
  auto openedChannelId = make_shared<optional<uint64_t>>();
  int64_t followUpWait = session->expectReply(
      followUpType, openTimeout + followUpTimeout,
      [openedChannelId](const Envelope& envelope) {
        return openedChannelId->has_value() &&
               envelope.channel_id() == **openedChannelId;
      });

  OpenedChannel opened;
  try {
    uint64_t channelId = startChannel(serviceType, titleId, openedChannelId);
    opened.channel = make_shared<ChannelTransport>(channelId, session);
  } catch (...) {
    session->cancelReply(followUpWait);
    throw;
  }

  try {
    opened.followUp = session->awaitReply(followUpWait, followUpTimeout);
  } catch (const TimeoutError&) {
    VLOG(1) << "No " << MessageType_Name(followUpType) << " on channel "
            << opened.channel->getChannelId();
  }
  return opened;
}

uint64_t ChannelMultiplexer::startChannel(
    ServiceType serviceType, uint32_t titleId,
    shared_ptr<optional<uint64_t>> openedChannelId) {
  const uint32_t requestId = nextChannelRequestId++;

  StartChannelRequest request;
  request.set_channel_request_id(requestId);
  request.set_service_type(serviceType);
  request.set_title_id(titleId);

  VLOG(1) << "Opening channel for " << ServiceType_Name(serviceType)
          << " title " << titleId << " with request id " << requestId;
  Envelope reply = session->sendAndWait(
      START_CHANNEL_RESPONSE, openTimeout,
      [&]() { session->send(START_CHANNEL_REQUEST, request); },
      [requestId, openedChannelId](const Envelope& envelope) {
        StartChannelResponse candidate;
        if (!candidate.ParseFromString(envelope.payload()) ||
            candidate.channel_request_id() != requestId) {
          return false;
        }
        if (openedChannelId && candidate.result() == 0) {
          *openedChannelId = candidate.channel_id();
        }
        return true;
      });
  StartChannelResponse response = parsePayload<StartChannelResponse>(reply);

  if (response.result() != 0) {
    LOG(WARNING) << "Console refused channel request " << requestId
                 << " with result " << response.result();
    throw ChannelOpenError(response.result());
  }
  LOG(INFO) << "Opened channel " << response.channel_id() << " for "
            << ServiceType_Name(serviceType);
  return response.channel_id();
}
}  // namespace sg
