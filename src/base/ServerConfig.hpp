#ifndef __WT_SERVER_CONFIG__
#define __WT_SERVER_CONFIG__

#include "Headers.hpp"

class CSimpleIniA;

namespace wt {
/**
 * @brief Settings for wtserver, read from the INI config file and then
 * overridden by command line flags.
 */
struct ServerConfig {
  // [Networking]
  int relayPort = DEFAULT_RELAY_PORT;
  int controlPort = DEFAULT_CONTROL_PORT;
  string bindIp = "0.0.0.0";

  // [Agents]
  string primaryBinary = "claude";
  string secondaryBinary = "codex";
  /** @brief Empty means $SHELL of the server process. */
  string preferredShell;
  /** @brief Root of per-user agent config directories. Empty means the
   * platform data folder. */
  string dataDir;

  // [Sessions]
  size_t scrollbackLines = DEFAULT_SCROLLBACK_LINES;
  int stopGraceMs = DEFAULT_STOP_GRACE_MS;
  int defaultCols = DEFAULT_TERMINAL_COLS;
  int defaultRows = DEFAULT_TERMINAL_ROWS;

  // [Relay]
  int heartbeatSeconds = DEFAULT_HEARTBEAT_SECONDS;
  int maxQueuedKilobytes = int(DEFAULT_MAX_QUEUED_BYTES / 1024);

  // [Debug]
  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";
};

/**
 * @brief Copies every value present in `ini` over the matching field of
 * `config`.  Values that do not parse as numbers throw std::invalid_argument.
 */
void applyConfigFile(const CSimpleIniA &ini, ServerConfig *config);

/**
 * @brief Loads `filename` and applies it to `config`.
 * @throws std::runtime_error if the file cannot be read or parsed.
 */
void loadConfigFile(const string &filename, ServerConfig *config);
}  // namespace wt

#endif  // __WT_SERVER_CONFIG__
