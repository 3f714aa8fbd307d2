#include "SessionKey.hpp"

namespace wt {
string terminalKindName(TerminalKind kind) {
  switch (kind) {
    case KIND_CLAUDE:
      return "claude";
    case KIND_SHELL:
      return "shell";
    case KIND_CODEX:
      return "codex";
  }
  STFATAL << "Unknown terminal kind: " << int(kind);
  return "";
}

optional<TerminalKind> parseTerminalKind(const string &name) {
  if (name == "claude") {
    return KIND_CLAUDE;
  }
  if (name == "shell") {
    return KIND_SHELL;
  }
  if (name == "codex") {
    return KIND_CODEX;
  }
  return nullopt;
}

string sessionStatusName(SessionStatus status) {
  switch (status) {
    case STATUS_IDLE:
      return "idle";
    case STATUS_STARTING:
      return "starting";
    case STATUS_RUNNING:
      return "running";
    case STATUS_STOPPING:
      return "stopping";
  }
  STFATAL << "Unknown session status: " << int(status);
  return "";
}

string terminalSignalName(TerminalSignal signal) {
  switch (signal) {
    case SIGNAL_INTERRUPT:
      return "SIGINT";
    case SIGNAL_TERMINATE:
      return "SIGTERM";
    case SIGNAL_KILL:
      return "SIGKILL";
  }
  STFATAL << "Unknown terminal signal: " << int(signal);
  return "";
}

optional<TerminalSignal> parseTerminalSignal(const string &name) {
  if (name == "SIGINT" || name == "interrupt") {
    return SIGNAL_INTERRUPT;
  }
  if (name == "SIGTERM" || name == "terminate") {
    return SIGNAL_TERMINATE;
  }
  if (name == "SIGKILL" || name == "kill") {
    return SIGNAL_KILL;
  }
  return nullopt;
}

int toPosixSignal(TerminalSignal signal) {
  switch (signal) {
    case SIGNAL_INTERRUPT:
      return SIGINT;
    case SIGNAL_TERMINATE:
      return SIGTERM;
    case SIGNAL_KILL:
      return SIGKILL;
  }
  STFATAL << "Unknown terminal signal: " << int(signal);
  return SIGKILL;
}
}  // namespace wt
