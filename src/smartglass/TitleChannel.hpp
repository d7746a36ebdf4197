#ifndef __SG_TITLE_CHANNEL__
#define __SG_TITLE_CHANNEL__

#include "ChannelTransport.hpp"
#include "JsonLib.hpp"

namespace sg {
typedef std::function<void(const json&)> TitleMessageHandler;

/**
 * @brief Channel bound to a running title.  Titles talk JSON.
 */
class TitleChannel {
 public:
  TitleChannel(shared_ptr<ChannelTransport> _channel,
               const optional<AuxiliaryStream>& _auxiliaryStream)
      : channel(_channel), auxiliaryStream(_auxiliaryStream) {}

  void sendTitleMessage(const json& message);

  /**
   * @brief Calls `handler` for each title message on this channel.  Messages
   * that are not valid JSON are logged and dropped.
   */
  int64_t addTitleMessageHandler(TitleMessageHandler handler);
  void removeTitleMessageHandler(int64_t handlerId) {
    channel->removeMessageHandler(handlerId);
  }

  /** @brief The auxiliary stream hello, when the console sent one. */
  const optional<AuxiliaryStream>& getAuxiliaryStream() const {
    return auxiliaryStream;
  }

  uint64_t getChannelId() const { return channel->getChannelId(); }

  void shutdown() { channel->shutdown(); }

 protected:
  shared_ptr<ChannelTransport> channel;
  optional<AuxiliaryStream> auxiliaryStream;
};
}  // namespace sg

#endif  // __SG_TITLE_CHANNEL__
