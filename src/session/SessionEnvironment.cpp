#include "SessionEnvironment.hpp"

#include "SessionKey.hpp"
#include "sago/platform_folders.h"

extern char **environ;

namespace wt {
const vector<string> EnvironmentCredentialResolver::CREDENTIAL_NAMES = {
    "ANTHROPIC_API_KEY", "OPENAI_API_KEY"};

map<string, string> EnvironmentCredentialResolver::resolveCredentials(
    const string &userId, const map<string, string> &sessionEnv) {
  map<string, string> credentials;
  for (const auto &name : CREDENTIAL_NAMES) {
    auto it = sessionEnv.find(name);
    if (it != sessionEnv.end() && !it->second.empty()) {
      credentials[name] = it->second;
      continue;
    }
    const char *value = ::getenv(name.c_str());
    if (value && *value) {
      credentials[name] = value;
    }
  }
  return credentials;
}

DataDirConfigResolver::DataDirConfigResolver(const string &_dataDir)
    : dataDir(_dataDir) {
  if (dataDir.empty()) {
    dataDir = sago::getDataHome() + "/webterm";
  }
}

optional<string> DataDirConfigResolver::resolveConfigDir(const string &userId,
                                                         TerminalKind kind) {
  if (kind == KIND_SHELL) {
    return nullopt;
  }
  bool validUser = !userId.empty() && userId != "." && userId != "..";
  for (char c : userId) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' &&
        c != '.') {
      validUser = false;
    }
  }
  if (!userId.empty() && !validUser) {
    LOG(WARNING) << "Ignoring unsafe user id for config dir: " << userId;
  }
  string dir = dataDir + "/" + terminalKindName(kind) +
               (validUser ? "/users/" + userId : string("/global"));
  try {
    fs::create_directories(dir);
  } catch (const fs::filesystem_error &fse) {
    LOG(ERROR) << "Cannot create config directory " << dir << ": "
               << fse.what();
    return nullopt;
  }
  return dir;
}

SessionEnvironment::SessionEnvironment(
    shared_ptr<CredentialResolver> _credentialResolver,
    shared_ptr<ConfigDirResolver> _configDirResolver)
    : credentialResolver(_credentialResolver),
      configDirResolver(_configDirResolver) {}

optional<string> SessionEnvironment::configDirVariable(TerminalKind kind) {
  switch (kind) {
    case KIND_CLAUDE:
      return string("CLAUDE_CONFIG_DIR");
    case KIND_CODEX:
      return string("CODEX_HOME");
    case KIND_SHELL:
      return nullopt;
  }
  return nullopt;
}

map<string, string> SessionEnvironment::build(TerminalKind kind,
                                              const SessionConfig &config) {
  map<string, string> env;
  for (char **it = environ; it && *it; it++) {
    string entry(*it);
    auto eq = entry.find('=');
    if (eq != string::npos) {
      env[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
  }
  env["TERM"] = "xterm-256color";
  env["COLORTERM"] = "truecolor";

  auto variable = configDirVariable(kind);
  if (variable && configDirResolver) {
    auto dir = configDirResolver->resolveConfigDir(config.user_id(), kind);
    if (dir) {
      env[*variable] = *dir;
    }
  }

  map<string, string> sessionEnv(config.env().begin(), config.env().end());
  if (credentialResolver && kind != KIND_SHELL) {
    for (const auto &it :
         credentialResolver->resolveCredentials(config.user_id(), sessionEnv)) {
      env[it.first] = it.second;
    }
  }
  for (const auto &it : sessionEnv) {
    env[it.first] = it.second;
  }
  return env;
}
}  // namespace wt
