#ifndef __WT_SESSION_ENVIRONMENT__
#define __WT_SESSION_ENVIRONMENT__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Supplies API credentials for a spawned agent.
 *
 * Implementations apply the priority session env > per-user keys > global
 * keys > server environment.  Only the result is consumed here.
 */
class CredentialResolver {
 public:
  virtual ~CredentialResolver() {}
  virtual map<string, string> resolveCredentials(
      const string &userId, const map<string, string> &sessionEnv) = 0;
};

/**
 * @brief Default resolver without a user store: session env, then the
 * server's own environment.
 */
class EnvironmentCredentialResolver : public CredentialResolver {
 public:
  virtual map<string, string> resolveCredentials(
      const string &userId, const map<string, string> &sessionEnv);

  static const vector<string> CREDENTIAL_NAMES;
};

/**
 * @brief Picks the agent config directory for a user and terminal kind.
 */
class ConfigDirResolver {
 public:
  virtual ~ConfigDirResolver() {}
  /** @brief Directory to expose to the agent, or nullopt for none. */
  virtual optional<string> resolveConfigDir(const string &userId,
                                            TerminalKind kind) = 0;
};

/**
 * @brief Keeps one directory per user under `<dataDir>/<kind>/users/`, or
 * `<dataDir>/<kind>/global` without a user.  Directories are created on
 * demand.
 */
class DataDirConfigResolver : public ConfigDirResolver {
 public:
  /** @param _dataDir Root directory; empty selects the platform data folder.
   */
  explicit DataDirConfigResolver(const string &_dataDir);

  virtual optional<string> resolveConfigDir(const string &userId,
                                            TerminalKind kind);

  const string &getDataDir() const { return dataDir; }

 protected:
  string dataDir;
};

/**
 * @brief Builds the environment of a spawned process.
 *
 * Layers, later ones winning: the server environment, terminal settings,
 * the agent config directory, resolved credentials, the session's own env.
 */
class SessionEnvironment {
 public:
  SessionEnvironment(shared_ptr<CredentialResolver> _credentialResolver,
                     shared_ptr<ConfigDirResolver> _configDirResolver);
  virtual ~SessionEnvironment() {}

  virtual map<string, string> build(TerminalKind kind,
                                    const SessionConfig &config);

  /** @brief Variable that carries the config directory for `kind`. */
  static optional<string> configDirVariable(TerminalKind kind);

 protected:
  shared_ptr<CredentialResolver> credentialResolver;
  shared_ptr<ConfigDirResolver> configDirResolver;
};
}  // namespace wt

#endif  // __WT_SESSION_ENVIRONMENT__
