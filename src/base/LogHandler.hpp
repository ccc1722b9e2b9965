#ifndef __BURROW_LOG_HANDLER__
#define __BURROW_LOG_HANDLER__

#include "BurrowConfig.hpp"
#include "Headers.hpp"

namespace burrow {
/**
 * @brief Configures easylogging++ for burrowd and the test runner.
 *
 * stdout belongs to the line protocol, so by default everything goes to a log
 * file and user-facing text goes through the separate "stdout" logger.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Applies the logging half of `config` and opens a fresh log file.
   *
   * Sets the verbose level, disables logging when `config.silent`, caps the
   * file at `config.maxLogSize` and installs rotation.  The caller still has
   * to reconfigure the default logger with `defaultConf`.
   *
   * @param directory Created if missing.
   * @param redirectStderr Sends stderr to a sibling file as well.
   * @return Full path of the new log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const BurrowConfig &config,
                              const string &directory, bool logToStdout,
                              bool redirectStderr);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages, used
   * for --help/--version output.
   */
  static void setupStdoutLogger();

  /** @brief `<prefix>-<local time>-<pid>.log` */
  static string logFileName(const string &prefix);

 private:
  static void rolloutHandler(const char *filename, std::size_t size);

  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace burrow
#endif  // __BURROW_LOG_HANDLER__
