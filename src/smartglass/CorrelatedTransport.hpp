#ifndef __SG_CORRELATED_TRANSPORT__
#define __SG_CORRELATED_TRANSPORT__

#include "Errors.hpp"
#include "Headers.hpp"
#include "MessageUtils.hpp"
#include "RawTransport.hpp"

namespace sg {
typedef std::function<void(const Envelope&)> MessageHandler;
typedef std::function<bool(const Envelope&)> EnvelopeMatcher;

/**
 * @brief Sends envelopes and lets callers block until a matching reply.
 *
 * Every received envelope takes two independent paths: it completes the
 * oldest pending wait whose type and matcher accept it (at most one), and it
 * is handed to every registered message handler.  Handlers run on the
 * receiving thread and must not block on a reply themselves.
 */
class CorrelatedTransport {
 public:
  explicit CorrelatedTransport(shared_ptr<RawTransport> _rawTransport);
  virtual ~CorrelatedTransport();

  /** @brief Hands an envelope to the raw transport. */
  void send(const Envelope& envelope);

  /**
   * @brief Registers a wait, runs `sendAction`, then blocks for the reply.
   *
   * The wait is in place before `sendAction` runs, so a reply that arrives
   * while the request is still being sent is not lost.  The deadline counts
   * from the registration.
   *
   * @param type Message type of the expected reply.
   * @param matcher Extra content check, may be null.
   * @throws TimeoutError when the deadline passes or the transport shuts down.
   */
  Envelope sendAndWait(MessageType type, chrono::milliseconds timeout,
                       const std::function<void()>& sendAction,
                       EnvelopeMatcher matcher = nullptr);

  /**
   * @brief Registers a wait without blocking.
   *
   * Every id returned must be finished with awaitReply() or cancelReply().
   * @throws TimeoutError when the transport is shut down.
   */
  int64_t expectReply(MessageType type, chrono::milliseconds timeout,
                      EnvelopeMatcher matcher = nullptr);

  /**
   * @brief Blocks until the wait registered by expectReply() completes.
   * @param restartTimeout When set, the deadline is moved to now plus this.
   * @throws TimeoutError when the deadline passes or the transport shuts down.
   */
  Envelope awaitReply(int64_t waitId,
                      optional<chrono::milliseconds> restartTimeout = nullopt);

  /** @brief Drops a wait registered by expectReply() without waiting. */
  void cancelReply(int64_t waitId);

  /**
   * @brief Typed variant of sendAndWait(): the predicate (may be null) sees
   * the parsed payload.  Envelopes whose payload does not parse never match.
   */
  template <typename T>
  T sendAndWait(MessageType type, chrono::milliseconds timeout,
                const std::function<void()>& sendAction,
                std::function<bool(const T&)> predicate) {
    EnvelopeMatcher matcher = [predicate](const Envelope& envelope) {
      T t;
      if (!t.ParseFromString(envelope.payload())) {
        return false;
      }
      return !predicate || predicate(t);
    };
    return parsePayload<T>(sendAndWait(type, timeout, sendAction, matcher));
  }

  /** @return An id for removeMessageHandler(). */
  int64_t addMessageHandler(MessageHandler handler);
  void removeMessageHandler(int64_t handlerId);

  /**
   * @brief Entry point for envelopes coming from the raw transport.
   */
  void handleIncoming(const Envelope& envelope);

  /**
   * @brief Fails every pending wait, detaches from and closes the raw
   * transport.  Later waits fail immediately.
   */
  void shutdown();

  bool isShuttingDown() {
    lock_guard<std::mutex> guard(transportMutex);
    return shuttingDown;
  }

  size_t getPendingWaitCount() {
    lock_guard<std::mutex> guard(transportMutex);
    return pendingWaits.size();
  }

 protected:
  struct PendingWait {
    MessageType type;
    EnvelopeMatcher matcher;
    chrono::steady_clock::time_point deadline;
    shared_ptr<std::promise<Envelope>> result;
  };

  /** @brief The caller's side of a wait, kept until it is awaited. */
  struct ExpectedReply {
    MessageType type;
    chrono::steady_clock::time_point deadline;
    std::future<Envelope> future;
  };

  /** @brief Fails and removes waits past their deadline.  Needs the lock. */
  void sweepExpiredWaits(chrono::steady_clock::time_point now);

  shared_ptr<RawTransport> rawTransport;
  /** @brief Pending waits keyed by registration order. */
  map<int64_t, PendingWait> pendingWaits;
  map<int64_t, ExpectedReply> expectedReplies;
  int64_t nextWaitId;
  map<int64_t, MessageHandler> messageHandlers;
  int64_t nextHandlerId;
  bool shuttingDown;
  std::mutex transportMutex;
};
}  // namespace sg

#endif  // __SG_CORRELATED_TRANSPORT__
