#ifndef __PT_LOG_HANDLER__
#define __PT_LOG_HANDLER__

#include "Headers.hpp"

namespace pt {
/**
 * @brief Configures easylogging++ for the daemon and the test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file inside `directory`.
   * @return Full path of the file that was created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &directory,
                              const string &filenamePrefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              const string &maxlogsize = "20971520");

  /** @brief Log rotation callback: drops the file that was rolled out. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it only writes the message.
   */
  static void setupStdoutLogger();

  /** @brief Default directory for daemon logs. */
  static string defaultLogDirectory();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace pt
#endif  // __PT_LOG_HANDLER__
