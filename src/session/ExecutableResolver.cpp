#include "ExecutableResolver.hpp"

namespace wt {
namespace {
bool isExecutableFile(const string &path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return false;
  }
  return ::access(path.c_str(), X_OK) == 0;
}
}  // namespace

ExecutableResolver::ExecutableResolver(const string &_primaryBinary,
                                       const string &_secondaryBinary,
                                       const string &_preferredShell)
    : primaryBinary(_primaryBinary),
      secondaryBinary(_secondaryBinary),
      preferredShell(_preferredShell) {}

vector<string> ExecutableResolver::getCandidates(TerminalKind kind) const {
  vector<string> candidates;
  switch (kind) {
    case KIND_CLAUDE:
      candidates.push_back(primaryBinary);
      break;
    case KIND_CODEX:
      candidates.push_back(secondaryBinary);
      break;
    case KIND_SHELL: {
      if (!preferredShell.empty()) {
        candidates.push_back(preferredShell);
      } else {
        const char *userShell = ::getenv("SHELL");
        if (userShell && *userShell) {
          candidates.push_back(userShell);
        }
      }
      candidates.push_back("bash");
      candidates.push_back("sh");
      break;
    }
  }
  return candidates;
}

optional<string> ExecutableResolver::resolve(TerminalKind kind) const {
  const char *pathEnv = ::getenv("PATH");
  string searchPath = pathEnv ? pathEnv : "/usr/local/bin:/usr/bin:/bin";
  for (const auto &candidate : getCandidates(kind)) {
    if (candidate.empty()) {
      continue;
    }
    auto found = findExecutable(candidate, searchPath);
    if (found) {
      VLOG(1) << "Resolved " << candidate << " to " << *found;
      return found;
    }
    VLOG(1) << "Could not resolve " << candidate;
  }
  return nullopt;
}

optional<string> ExecutableResolver::findExecutable(const string &name,
                                                    const string &searchPath) {
  if (name.find('/') != string::npos) {
    if (isExecutableFile(name)) {
      return name;
    }
    return nullopt;
  }
  for (const auto &dir : split(searchPath, ':')) {
    string candidate = (dir.empty() ? string(".") : dir) + "/" + name;
    if (isExecutableFile(candidate)) {
      return candidate;
    }
  }
  return nullopt;
}
}  // namespace wt
