#ifndef __OT_LOG_HANDLER__
#define __OT_LOG_HANDLER__

#include "Headers.hpp"

namespace ot {
/**
 * @brief Configures easylogging++ for the OpsTerm binaries and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a fresh file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Applies `defaultConf` and installs the rollover callback.
   */
  static void apply(const el::Configurations &defaultConf, int verbosity);

  /**
   * @brief Removes the rolled-over log file.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

  /** @brief Names the calling thread in every log line it emits. */
  static void nameThread(const string &name);

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace ot
#endif  // __OT_LOG_HANDLER__
