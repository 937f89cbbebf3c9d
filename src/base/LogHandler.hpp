#ifndef __VT_LOG_HANDLER__
#define __VT_LOG_HANDLER__

#include "Headers.hpp"

namespace vt {
/**
 * @brief Configures easylogging++ for the relay and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally writing stderr to disk.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Pre-roll-out callback: deletes the rolled file.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  /**
   * @brief Ensures the directory exists and creates a new log file.
   * @throws std::runtime_error if the directory cannot be created.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace vt
#endif  // __VT_LOG_HANDLER__
