#ifndef __SG_ERRORS__
#define __SG_ERRORS__

#include "Headers.hpp"

namespace sg {
/**
 * @brief The device could not be reached or did not identify itself.
 */
class DiscoveryError : public std::runtime_error {
 public:
  explicit DiscoveryError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief No matching reply arrived before the deadline of a wait.
 */
class TimeoutError : public std::runtime_error {
 public:
  explicit TimeoutError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief Every handshake attempt in the backoff schedule timed out, or the
 * console refused the connection.
 */
class ConnectionFailedError : public std::runtime_error {
 public:
  explicit ConnectionFailedError(const string& what)
      : std::runtime_error(what) {}
};

/**
 * @brief The console answered a start-channel request with a non-zero result.
 */
class ChannelOpenError : public std::runtime_error {
 public:
  explicit ChannelOpenError(uint32_t _result)
      : std::runtime_error("Failed to open channel: result " +
                           to_string(_result)),
        result(_result) {}

  uint32_t getResult() const { return result; }

 protected:
  uint32_t result;
};

/**
 * @brief Socket, framing or crypto failure below the session layer.
 */
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const string& what) : std::runtime_error(what) {}
};
}  // namespace sg

#endif  // __SG_ERRORS__
