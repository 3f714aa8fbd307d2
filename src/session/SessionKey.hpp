#ifndef __WT_SESSION_KEY__
#define __WT_SESSION_KEY__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Identity of a session handle and of its terminal room.
 */
struct SessionKey {
  string sessionId;
  TerminalKind kind = KIND_CLAUDE;

  SessionKey() {}
  SessionKey(const string &_sessionId, TerminalKind _kind)
      : sessionId(_sessionId), kind(_kind) {}

  bool operator<(const SessionKey &other) const {
    if (sessionId != other.sessionId) {
      return sessionId < other.sessionId;
    }
    return int(kind) < int(other.kind);
  }
  bool operator==(const SessionKey &other) const {
    return sessionId == other.sessionId && kind == other.kind;
  }
  bool operator!=(const SessionKey &other) const { return !(*this == other); }
};

/** @brief Wire name of a terminal kind: claude, shell or codex. */
string terminalKindName(TerminalKind kind);
/** @brief Inverse of terminalKindName; empty for unknown names. */
optional<TerminalKind> parseTerminalKind(const string &name);

/** @brief Wire name of a status: idle, starting, running or stopping. */
string sessionStatusName(SessionStatus status);

/** @brief Wire name of a signal: SIGINT, SIGTERM or SIGKILL. */
string terminalSignalName(TerminalSignal signal);
/** @brief Accepts SIGINT/SIGTERM/SIGKILL and interrupt/terminate/kill. */
optional<TerminalSignal> parseTerminalSignal(const string &name);
/** @brief POSIX signal number delivered for a terminal signal. */
int toPosixSignal(TerminalSignal signal);

inline std::ostream &operator<<(std::ostream &os, const SessionKey &key) {
  os << key.sessionId << "/" << terminalKindName(key.kind);
  return os;
}
}  // namespace wt

#endif  // __WT_SESSION_KEY__
