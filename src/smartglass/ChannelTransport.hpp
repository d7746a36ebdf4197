#ifndef __SG_CHANNEL_TRANSPORT__
#define __SG_CHANNEL_TRANSPORT__

#include "SessionTransport.hpp"

namespace sg {
/**
 * @brief Handle to an opened channel.
 *
 * Shares the session's transport; all it adds is the channel id, stamped on
 * outbound envelopes and required on inbound ones.
 */
class ChannelTransport {
 public:
  ChannelTransport(uint64_t _channelId, shared_ptr<SessionTransport> _session);
  virtual ~ChannelTransport();

  uint64_t getChannelId() const { return channelId; }

  void send(MessageType type, const google::protobuf::MessageLite& payload);

  /**
   * @brief Like SessionTransport::sendAndWait() but only envelopes on this
   * channel can match.
   */
  Envelope sendAndWait(MessageType type, chrono::milliseconds timeout,
                       const std::function<void()>& sendAction,
                       EnvelopeMatcher matcher = nullptr);

  template <typename T>
  T sendAndWait(MessageType type, chrono::milliseconds timeout,
                const std::function<void()>& sendAction,
                std::function<bool(const T&)> predicate) {
    EnvelopeMatcher matcher = [predicate](const Envelope& envelope) {
      T t;
      return t.ParseFromString(envelope.payload()) &&
             (!predicate || predicate(t));
    };
    return parsePayload<T>(sendAndWait(type, timeout, sendAction, matcher));
  }

  /** @brief Subscribes to envelopes on this channel only. */
  int64_t addMessageHandler(MessageHandler handler);
  void removeMessageHandler(int64_t handlerId);

  /**
   * @brief Drops this handle's subscriptions.  Nothing is sent to the
   * console.
   */
  void shutdown();

 protected:
  uint64_t channelId;
  shared_ptr<SessionTransport> session;
  set<int64_t> handlerIds;
  std::mutex channelMutex;
};
}  // namespace sg

#endif  // __SG_CHANNEL_TRANSPORT__
