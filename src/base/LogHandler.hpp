#ifndef __WT_LOG_HANDLER__
#define __WT_LOG_HANDLER__

#include "Headers.hpp"

namespace wt {
struct LogFileOptions {
  string directory;
  /** @brief Log files are named `<prefix>-<datetime>_<pid>.log`. */
  string prefix;
  bool toStdout = false;
  /** @brief Also send stderr to `<prefix>-stderr-<datetime>_<pid>.log`. */
  bool redirectStderr = false;
  string maxFileSize = "20971520";
};

/**
 * @brief Configures easylogging++ for the server and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points every level at a fresh, size capped log file.
   * @return Full path of the log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const LogFileOptions &fileOptions);

  /** @brief Sets the VLOG level, or turns logging off entirely. */
  static void setVerbosity(el::Configurations *defaultConf, int level,
                           bool silent);

  /** @brief Performs log rotation by removing the supplied filename. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace wt
#endif  // __WT_LOG_HANDLER__
