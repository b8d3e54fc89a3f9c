#ifndef __WT_LOG_HANDLER__
#define __WT_LOG_HANDLER__

#include "EngineConfig.hpp"
#include "Headers.hpp"

namespace wt {
/**
 * @brief easylogging++ setup for the client and the test runner.
 *
 * Everything goes to one rotating file per process.  The "stdout" logger is
 * kept for user-facing messages; a terminal session owns the real stdout, so
 * regular logs only reach it when asked for.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points `defaultConf` at a new log file under `path`, optionally
   * sending stderr to a sibling file.  Throws std::runtime_error when the
   * directory or file cannot be created.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Applies the [Debug] settings of `config`: verbosity, log
   * directory and rotation size.  Installs the result as the default logger.
   */
  static void setupSessionLogging(el::Configurations *defaultConf,
                                  const EngineConfig &config,
                                  const string &filenamePrefix,
                                  bool logToStdout, bool redirectStderrToFile);

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  static void setupStdoutLogger();

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace wt
#endif  // __WT_LOG_HANDLER__
