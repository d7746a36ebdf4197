#ifndef __SG_SMARTGLASS_CLIENT__
#define __SG_SMARTGLASS_CLIENT__

#include "AsyncLazy.hpp"
#include "ChannelMultiplexer.hpp"
#include "ClientConfig.hpp"
#include "Handshaker.hpp"
#include "InputChannel.hpp"
#include "SessionTransport.hpp"
#include "TitleChannel.hpp"

namespace sg {
/**
 * @brief A connected console session.
 *
 * Owns the transport the handshake ran on, the session on top of it and the
 * lazily opened input channel.  shutdown() releases them in that reverse
 * order: input channel, session, transport.  No stop or close message is
 * sent to the console for any of them.
 */
class SmartGlassClient {
 public:
  /**
   * @brief Discovers and connects over UDP.
   * @throws DiscoveryError, ConnectionFailedError
   */
  static shared_ptr<SmartGlassClient> connect(const string& addressOrHostname,
                                              const ClientConfig& config);

  /**
   * @brief Connects with caller-provided discovery and transports.
   */
  static shared_ptr<SmartGlassClient> connect(
      shared_ptr<DeviceDiscovery> discovery, TransportFactory transportFactory,
      const string& addressOrHostname, const ClientConfig& config);

  SmartGlassClient(const EstablishedSession& session,
                   const ClientConfig& _config);
  virtual ~SmartGlassClient();

  int64_t addConsoleStatusHandler(ConsoleStatusHandler handler) {
    return session->addConsoleStatusHandler(handler);
  }
  void removeConsoleStatusHandler(int64_t handlerId) {
    session->removeConsoleStatusHandler(handlerId);
  }
  optional<ConsoleStatus> getConsoleStatus() {
    return session->getConsoleStatus();
  }

  /**
   * @brief Asks the console to launch a title.  Nothing is awaited.
   * @param launchParams Appended percent-encoded to the URI unless blank.
   */
  void launchTitle(uint32_t titleId, const string& launchParams = "",
                   ActiveTitleLocation location = DEFAULT);

  /**
   * @brief Records the last `lastSeconds` of gameplay.  Nothing is awaited.
   * @throws std::invalid_argument when `lastSeconds` is negative.
   */
  void startDvrRecording(int lastSeconds = 60);

  /**
   * @brief The SystemInput channel, opened by the first caller.  Concurrent
   * callers share one open and get the same instance (or error).
   */
  shared_ptr<InputChannel> getInputChannel();

  /**
   * @brief Opens a channel to a title, then gives the console up to the aux
   * hello timeout to send its auxiliary stream hello.  A missing hello is not
   * an error.
   * @throws TimeoutError, ChannelOpenError
   */
  shared_ptr<TitleChannel> startTitleChannel(uint32_t titleId);

  /** @brief Releases everything.  Safe to call more than once. */
  void shutdown();

  uint32_t getParticipantId() const { return participantId; }
  const string& getDeviceId() const { return deviceId; }
  const Device& getDevice() const { return device; }

  static string buildLaunchUri(uint32_t titleId, const string& launchParams);

 protected:
  /** @brief Release steps run by shutdown(), in this order. */
  virtual void releaseInputChannel();
  virtual void releaseSession();
  virtual void releaseTransport();

  Device device;
  uint32_t participantId;
  string deviceId;
  ClientConfig config;
  shared_ptr<CorrelatedTransport> transport;
  shared_ptr<SessionTransport> session;
  shared_ptr<ChannelMultiplexer> multiplexer;
  AsyncLazy<InputChannel> inputChannel;
  bool shutDown;
  std::mutex shutdownMutex;
};

/**
 * @brief Percent-encodes everything except RFC 3986 unreserved characters.
 */
string escapeUriData(const string& s);
}  // namespace sg

#endif  // __SG_SMARTGLASS_CLIENT__
