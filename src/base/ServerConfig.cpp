#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace wt {
namespace {
void readInt(const CSimpleIniA &ini, const char *section, const char *key,
             int *value) {
  const char *s = ini.GetValue(section, key, NULL);
  if (s) {
    *value = stoi(s);
  }
}

// Throws std::invalid_argument when the value falls outside [minimum, maximum].
void readBoundedInt(const CSimpleIniA &ini, const char *section,
                    const char *key, int minimum, int maximum, int *value) {
  int parsed = *value;
  readInt(ini, section, key, &parsed);
  if (parsed < minimum || parsed > maximum) {
    throw std::invalid_argument(string(key) + " must be between " +
                                to_string(minimum) + " and " +
                                to_string(maximum));
  }
  *value = parsed;
}

void readString(const CSimpleIniA &ini, const char *section, const char *key,
                string *value) {
  const char *s = ini.GetValue(section, key, NULL);
  if (s) {
    *value = string(s);
  }
}
}  // namespace

void applyConfigFile(const CSimpleIniA &ini, ServerConfig *config) {
  readBoundedInt(ini, "Networking", "port", 1, 65535, &config->relayPort);
  readBoundedInt(ini, "Networking", "control_port", 1, 65535,
                 &config->controlPort);
  readString(ini, "Networking", "bind_ip", &config->bindIp);

  readString(ini, "Agents", "primary_binary", &config->primaryBinary);
  readString(ini, "Agents", "secondary_binary", &config->secondaryBinary);
  readString(ini, "Agents", "preferred_shell", &config->preferredShell);
  readString(ini, "Agents", "data_dir", &config->dataDir);

  const char *scrollback = ini.GetValue("Sessions", "scrollback_lines", NULL);
  if (scrollback) {
    int lines = stoi(scrollback);
    if (lines <= 0) {
      throw std::invalid_argument("scrollback_lines must be positive");
    }
    config->scrollbackLines = size_t(lines);
  }
  readBoundedInt(ini, "Sessions", "stop_grace_ms", 1, INT_MAX,
                 &config->stopGraceMs);
  readBoundedInt(ini, "Sessions", "default_cols", 1, 65535,
                 &config->defaultCols);
  readBoundedInt(ini, "Sessions", "default_rows", 1, 65535,
                 &config->defaultRows);

  readBoundedInt(ini, "Relay", "heartbeat_seconds", 1, 24 * 60 * 60,
                 &config->heartbeatSeconds);
  readBoundedInt(ini, "Relay", "max_queued_kb", 1, 1024 * 1024,
                 &config->maxQueuedKilobytes);

  readInt(ini, "Debug", "verbose", &config->verbose);
  const char *silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->silent = atoi(silent) != 0;
  }
  // read log file size limit
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config->maxLogSize = string(logsize);
  }
}

void loadConfigFile(const string &filename, ServerConfig *config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }
  try {
    applyConfigFile(ini, config);
  } catch (const std::logic_error &le) {
    throw std::runtime_error("Invalid value in config file " + filename +
                             ": " + le.what());
  }
}
}  // namespace wt
