#ifndef __SG_SESSION_TRANSPORT__
#define __SG_SESSION_TRANSPORT__

#include "CorrelatedTransport.hpp"

namespace sg {
typedef std::function<void(const ConsoleStatus&)> ConsoleStatusHandler;

struct SessionInfo {
  uint32_t participantId;
  string deviceId;
};

/**
 * @brief The established session on top of a CorrelatedTransport.
 *
 * Outbound envelopes are stamped with the participant id and the next
 * session sequence number.  Inbound session envelopes are fanned out to the
 * message handlers; console status updates also refresh the latest snapshot
 * and raise the status handlers, synchronously on the dispatch path.
 */
class SessionTransport {
 public:
  /**
   * @brief Subscribes to `transport` and announces this client with a
   * LocalJoin.  A failed announcement is only logged.
   */
  SessionTransport(shared_ptr<CorrelatedTransport> _transport,
                   const SessionInfo& _sessionInfo,
                   uint32_t firstSequenceNumber);
  virtual ~SessionTransport();

  /**
   * @brief Stamps and sends a session message.
   * @param channelId Zero for messages outside any channel.
   */
  void send(MessageType type, const google::protobuf::MessageLite& payload,
            uint64_t channelId = 0);

  Envelope sendAndWait(MessageType type, chrono::milliseconds timeout,
                       const std::function<void()>& sendAction,
                       EnvelopeMatcher matcher = nullptr) {
    return transport->sendAndWait(type, timeout, sendAction, matcher);
  }

  int64_t expectReply(MessageType type, chrono::milliseconds timeout,
                      EnvelopeMatcher matcher = nullptr) {
    return transport->expectReply(type, timeout, matcher);
  }

  Envelope awaitReply(int64_t waitId,
                      optional<chrono::milliseconds> restartTimeout = nullopt) {
    return transport->awaitReply(waitId, restartTimeout);
  }

  void cancelReply(int64_t waitId) { transport->cancelReply(waitId); }

  template <typename T>
  T sendAndWait(MessageType type, chrono::milliseconds timeout,
                const std::function<void()>& sendAction,
                std::function<bool(const T&)> predicate) {
    return transport->sendAndWait<T>(type, timeout, sendAction, predicate);
  }

  int64_t addMessageHandler(MessageHandler handler);
  void removeMessageHandler(int64_t handlerId);

  int64_t addConsoleStatusHandler(ConsoleStatusHandler handler);
  void removeConsoleStatusHandler(int64_t handlerId);

  /** @brief Latest console status seen, if any arrived yet. */
  optional<ConsoleStatus> getConsoleStatus();

  const SessionInfo& getSessionInfo() const { return sessionInfo; }

  /** @brief Detaches from the transport and drops every handler. */
  void shutdown();

 protected:
  void handleMessage(const Envelope& envelope);

  shared_ptr<CorrelatedTransport> transport;
  SessionInfo sessionInfo;
  std::atomic<uint32_t> nextSequenceNumber;
  int64_t transportHandlerId;
  map<int64_t, MessageHandler> messageHandlers;
  map<int64_t, ConsoleStatusHandler> statusHandlers;
  int64_t nextHandlerId;
  optional<ConsoleStatus> consoleStatus;
  bool shuttingDown;
  std::mutex sessionMutex;
};
}  // namespace sg

#endif  // __SG_SESSION_TRANSPORT__
