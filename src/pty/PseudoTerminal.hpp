#ifndef __WT_PSEUDO_TERMINAL_HPP__
#define __WT_PSEUDO_TERMINAL_HPP__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Everything needed to launch one process on a new pseudo-terminal.
 */
struct SpawnRequest {
  string executable;
  vector<string> args;
  string workDir;
  map<string, string> environment;
  int cols = DEFAULT_TERMINAL_COLS;
  int rows = DEFAULT_TERMINAL_ROWS;
};

/**
 * @brief One OS process attached to a pseudo-terminal.
 *
 * Output and exit are reported through the callbacks passed to `spawn`, on
 * the event loop that owns the terminal.  After `close()` no callback fires.
 */
class PseudoTerminal {
 public:
  typedef function<void(const string &)> OutputCallback;
  /** @brief Receives the exit code and, if the process was killed by a
   * signal, the signal number. */
  typedef function<void(int, optional<int>)> ExitCallback;

  virtual ~PseudoTerminal() {}

  /**
   * @brief Forks the process and starts delivering its output.
   * @returns The pid of the child.
   * @throws SessionError with SPAWN_FAILED if the terminal cannot be created.
   */
  virtual pid_t spawn(const SpawnRequest &request, OutputCallback onOutput,
                      ExitCallback onExit) = 0;
  /** @brief Queues raw bytes for the process's input. */
  virtual void write(const string &data) = 0;
  /** @brief Applies a new window geometry. */
  virtual void resize(int cols, int rows) = 0;
  /** @brief Delivers a POSIX signal to the process. */
  virtual void kill(int signum) = 0;
  virtual pid_t getPid() const = 0;
  /** @brief Stops callbacks and releases the terminal device. */
  virtual void close() = 0;
};

/**
 * @brief Creates pseudo-terminals; replaced by a fake in tests.
 */
class PseudoTerminalFactory {
 public:
  virtual ~PseudoTerminalFactory() {}
  virtual shared_ptr<PseudoTerminal> create() = 0;
};
}  // namespace wt

#endif  // __WT_PSEUDO_TERMINAL_HPP__
