#ifndef __SG_CLIENT_CONFIG__
#define __SG_CLIENT_CONFIG__

#include "Headers.hpp"

namespace sg {
/**
 * @brief Optional Xbox Live credentials presented during the handshake.
 */
struct Credentials {
  string userHash;
  string authorization;
};

/**
 * @brief Tunables for discovery, the handshake and channel operations.
 *
 * The defaults are the values consoles are known to work with.
 */
struct ClientConfig {
  int port = DEFAULT_DEVICE_PORT;
  chrono::milliseconds discoveryTimeout = chrono::milliseconds(1000);
  /** @brief Window of a single handshake attempt. */
  chrono::milliseconds connectTimeout = chrono::milliseconds(1000);
  /** @brief Pause before each retry, in order; its size bounds the retries. */
  vector<chrono::milliseconds> connectRetries = {
      chrono::milliseconds(500), chrono::milliseconds(500),
      chrono::milliseconds(1500), chrono::milliseconds(5000)};
  chrono::milliseconds channelTimeout = chrono::milliseconds(1000);
  chrono::milliseconds auxHelloTimeout = chrono::milliseconds(1000);
  string userHash;
  string authorization;
  int verbose = 0;
  bool logToStdout = false;
  /** @brief Where log files go, the temp directory when empty. */
  string logDir;

  /**
   * @brief Overrides fields with the values found in an INI file.
   * @throws std::runtime_error if the file cannot be read or a value is
   * malformed.
   */
  void loadFromIni(const string& filename);

  /** @brief Credentials, when both halves are configured. */
  optional<Credentials> getCredentials() const;
};

/**
 * @brief Parses "500, 500,1500" into durations.
 * @throws std::runtime_error on a non-numeric or negative entry.
 */
vector<chrono::milliseconds> parseRetrySchedule(const string& schedule);
}  // namespace sg

#endif  // __SG_CLIENT_CONFIG__
