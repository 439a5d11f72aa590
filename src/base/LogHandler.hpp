#ifndef __PTYHOST_LOG_HANDLER__
#define __PTYHOST_LOG_HANDLER__

#include "Headers.hpp"

namespace ptyhost {
/**
 * @brief Configures easylogging++ for a process whose stdout is a data
 * channel.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging with the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a fresh file under `path`.
   * @param redirectStderrToFile Also reopen stderr onto a sibling file so
   * nothing stray reaches the embedder.
   * @return The full name of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              string maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new, exclusive log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace ptyhost
#endif  // __PTYHOST_LOG_HANDLER__
