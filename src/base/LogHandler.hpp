#ifndef __SG_LOG_HANDLER__
#define __SG_LOG_HANDLER__

#include "Headers.hpp"

namespace sg {
/**
 * @brief Configures easylogging++ for the client library, tool and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging++ from `argc/argv`.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default configuration at a fresh log file in `path`.
   * @param filenamePrefix Prefix of the log file, a timestamp is appended.
   * @param logToStdout Also echo every log line on stdout.
   * @param maxlogsize Rollover threshold in bytes.
   * @return The full path of the created log file.
   */
  static string setupLogFile(el::Configurations *defaultConf,
                             const string &path, const string &filenamePrefix,
                             bool logToStdout = false,
                             const string &maxlogsize = "20971520");

  /**
   * @brief Removes a rolled-over log file.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace sg
#endif  // __SG_LOG_HANDLER__
