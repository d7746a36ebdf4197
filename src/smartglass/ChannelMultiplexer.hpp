#ifndef __SG_CHANNEL_MULTIPLEXER__
#define __SG_CHANNEL_MULTIPLEXER__

#include "ChannelTransport.hpp"

namespace sg {
struct OpenedChannel {
  shared_ptr<ChannelTransport> channel;
  optional<Envelope> followUp;
};

/**
 * @brief Opens channels on a session.
 *
 * Each open sends a StartChannelRequest tagged with a fresh request id
 * (1, 2, 3, ... never reused) and waits for the StartChannelResponse that
 * echoes it.  There is no retry.
 */
class ChannelMultiplexer {
 public:
  ChannelMultiplexer(shared_ptr<SessionTransport> _session,
                     chrono::milliseconds _openTimeout);

  /**
   * @param titleId Zero when the service is not bound to a title.
   * @throws TimeoutError when the console does not answer in time.
   * @throws ChannelOpenError when the console answers with a non-zero result.
   */
  shared_ptr<ChannelTransport> openChannel(ServiceType serviceType,
                                           uint32_t titleId = 0);

  /**
   * @brief Opens a channel and picks up the first `followUpType` envelope the
   * console sends on it.
   *
   * The follow-up wait is registered with the open request, so a follow-up
   * sent right behind the StartChannelResponse is kept.  Once the channel is
   * open the console gets `followUpTimeout` to send it.  A missing follow-up
   * leaves OpenedChannel::followUp empty.
   *
   * @throws TimeoutError, ChannelOpenError as openChannel().
   */
  OpenedChannel openChannelWithFollowUp(ServiceType serviceType,
                                        uint32_t titleId,
                                        MessageType followUpType,
                                        chrono::milliseconds followUpTimeout);

 protected:
  /**
   * @brief Sends the StartChannelRequest and waits for its response.
   * @param openedChannelId When set, receives the channel id from inside the
   * response matcher, before any later envelope is dispatched.
   * @return The server-assigned channel id.
   */
  uint64_t startChannel(ServiceType serviceType, uint32_t titleId,
                        shared_ptr<optional<uint64_t>> openedChannelId);

  shared_ptr<SessionTransport> session;
  chrono::milliseconds openTimeout;
  std::atomic<uint32_t> nextChannelRequestId;
};
}  // namespace sg

#endif  // __SG_CHANNEL_MULTIPLEXER__
