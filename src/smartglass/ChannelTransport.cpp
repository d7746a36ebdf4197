#include "ChannelTransport.hpp"

namespace sg {
ChannelTransport::ChannelTransport(uint64_t _channelId,
                                   shared_ptr<SessionTransport> _session)
    : channelId(_channelId), session(_session) {}

ChannelTransport::~ChannelTransport() { shutdown(); }

void ChannelTransport::send(MessageType type,
                            const google::protobuf::MessageLite& payload) {
  session->send(type, payload, channelId);
}

Envelope ChannelTransport::sendAndWait(MessageType type,
                                       chrono::milliseconds timeout,
                                       const std::function<void()>& sendAction,
                                       EnvelopeMatcher matcher) {
  uint64_t id = channelId;
  return session->sendAndWait(
      type, timeout, sendAction, [id, matcher](const Envelope& envelope) {
        return envelope.channel_id() == id && (!matcher || matcher(envelope));
      });
}

int64_t ChannelTransport::addMessageHandler(MessageHandler handler) {
  uint64_t id = channelId;
  int64_t handlerId =
      session->addMessageHandler([id, handler](const Envelope& envelope) {
        if (envelope.channel_id() == id) {
          handler(envelope);
        }
      });
  lock_guard<std::mutex> guard(channelMutex);
  handlerIds.insert(handlerId);
  return handlerId;
}

void ChannelTransport::removeMessageHandler(int64_t handlerId) {
  {
    lock_guard<std::mutex> guard(channelMutex);
    handlerIds.erase(handlerId);
  }
  session->removeMessageHandler(handlerId);
}

void ChannelTransport::shutdown() {
  set<int64_t> ids;
  {
    lock_guard<std::mutex> guard(channelMutex);
    ids.swap(handlerIds);
  }
  for (int64_t handlerId : ids) {
    session->removeMessageHandler(handlerId);
  }
}
}  // namespace sg
