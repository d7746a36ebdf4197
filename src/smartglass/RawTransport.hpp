#ifndef __SG_RAW_TRANSPORT__
#define __SG_RAW_TRANSPORT__

#include "Headers.hpp"

namespace sg {
/**
 * @brief Moves whole envelopes to and from a console.
 *
 * Framing and encryption live below this interface.  Received envelopes are
 * handed to the receive handler one at a time, in arrival order.
 */
class RawTransport {
 public:
  typedef std::function<void(const Envelope&)> ReceiveHandler;

  virtual ~RawTransport() {}

  /**
   * @brief Transmits an envelope without waiting for anything.
   * @throws TransportError if the envelope could not be handed to the network.
   */
  virtual void send(const Envelope& envelope) = 0;
  /**
   * @brief Installs the handler for received envelopes (null detaches).
   *
   * Returns only once no call to the previous handler is still running.
   */
  virtual void setReceiveHandler(ReceiveHandler handler) = 0;
  /** @brief Stops receiving and releases the socket. */
  virtual void close() = 0;
};
}  // namespace sg

#endif  // __SG_RAW_TRANSPORT__
