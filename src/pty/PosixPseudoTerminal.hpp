#ifndef __WT_POSIX_PSEUDO_TERMINAL_HPP__
#define __WT_POSIX_PSEUDO_TERMINAL_HPP__

#include <boost/asio.hpp>

#include "PseudoTerminal.hpp"

namespace wt {
/**
 * @brief forkpty() backed terminal whose master fd is serviced by an asio
 * event loop.
 *
 * Child exit is detected through SIGCHLD and `waitpid(pid, WNOHANG)`, so
 * only this terminal's own child is ever reaped.  Output still queued in the
 * master when the child is reaped is drained before the exit callback runs.
 */
class PosixPseudoTerminal
    : public PseudoTerminal,
      public std::enable_shared_from_this<PosixPseudoTerminal> {
 public:
  explicit PosixPseudoTerminal(boost::asio::io_context &_ioContext);
  virtual ~PosixPseudoTerminal();

  virtual pid_t spawn(const SpawnRequest &request, OutputCallback _onOutput,
                      ExitCallback _onExit);
  virtual void write(const string &data);
  virtual void resize(int cols, int rows);
  virtual void kill(int signum);
  virtual pid_t getPid() const { return pid; }
  virtual void close();

 protected:
  boost::asio::io_context &ioContext;
  boost::asio::posix::stream_descriptor master;
  boost::asio::signal_set childSignals;
  pid_t pid;
  bool closed;
  bool exited;
  bool writing;
  std::array<char, 16 * 1024> readBuffer;
  std::deque<string> pendingWrites;
  OutputCallback onOutput;
  ExitCallback onExit;

  void readOutput();
  void writeNext();
  void waitForExit();
  /** @brief Reaps the child if it has exited and fires the exit callback. */
  bool checkExited();
  /** @brief Reads whatever is left in the master without blocking. */
  void drainOutput();
};

class PosixPseudoTerminalFactory : public PseudoTerminalFactory {
 public:
  explicit PosixPseudoTerminalFactory(boost::asio::io_context &_ioContext)
      : ioContext(_ioContext) {}

  virtual shared_ptr<PseudoTerminal> create() {
    return std::make_shared<PosixPseudoTerminal>(ioContext);
  }

 protected:
  boost::asio::io_context &ioContext;
};
}  // namespace wt

#endif  // __WT_POSIX_PSEUDO_TERMINAL_HPP__
