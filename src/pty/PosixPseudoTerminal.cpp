#include "PosixPseudoTerminal.hpp"

#include "SessionError.hpp"

namespace wt {
namespace {
// Everything the child needs is laid out before fork() because the server is
// multithreaded and only async-signal-safe calls are allowed in the child.
struct ExecImage {
  vector<string> argvStorage;
  vector<string> envStorage;
  vector<char *> argv;
  vector<char *> envp;

  explicit ExecImage(const SpawnRequest &request) {
    argvStorage.push_back(fs::path(request.executable).filename().string());
    for (const auto &arg : request.args) {
      argvStorage.push_back(arg);
    }
    for (const auto &it : request.environment) {
      envStorage.push_back(it.first + "=" + it.second);
    }
    for (auto &s : argvStorage) {
      argv.push_back(&s[0]);
    }
    argv.push_back(NULL);
    for (auto &s : envStorage) {
      envp.push_back(&s[0]);
    }
    envp.push_back(NULL);
  }
};

void writeToStderr(const char *message) {
  ssize_t ignored = ::write(STDERR_FILENO, message, strlen(message));
  (void)ignored;
}
}  // namespace

PosixPseudoTerminal::PosixPseudoTerminal(boost::asio::io_context &_ioContext)
    : ioContext(_ioContext),
      master(_ioContext),
      childSignals(_ioContext, SIGCHLD),
      pid(-1),
      closed(false),
      exited(false),
      writing(false) {}

PosixPseudoTerminal::~PosixPseudoTerminal() { close(); }

pid_t PosixPseudoTerminal::spawn(const SpawnRequest &request,
                                 OutputCallback _onOutput,
                                 ExitCallback _onExit) {
  ExecImage image(request);
  const char *workDir = request.workDir.c_str();
  const char *executable = request.executable.c_str();
  long maxFd = sysconf(_SC_OPEN_MAX);
  if (maxFd < 0 || maxFd > 65536) {
    maxFd = 65536;
  }

  winsize win;
  memset(&win, 0, sizeof(winsize));
  win.ws_col = request.cols;
  win.ws_row = request.rows;

  int masterFd = -1;
  pid_t childPid = forkpty(&masterFd, NULL, NULL, &win);
  switch (childPid) {
    case -1:
      throw SessionError(SessionErrorCode::SPAWN_FAILED,
                         string("forkpty failed: ") + strerror(GetErrno()));
    case 0: {
      // bash remembers the SIGCHLD disposition it starts with, and the server
      // ignores SIGPIPE; give the child the defaults.
      ::signal(SIGCHLD, SIG_DFL);
      ::signal(SIGPIPE, SIG_DFL);
      for (int fd = STDERR_FILENO + 1; fd < maxFd; fd++) {
        ::close(fd);
      }
      if (::chdir(workDir) == -1) {
        writeToStderr("wtserver: cannot enter working directory\r\n");
        _exit(127);
      }
      ::execve(executable, image.argv.data(), image.envp.data());
      writeToStderr("wtserver: exec failed\r\n");
      _exit(127);
    }
    default:
      break;
  }

  pid = childPid;
  onOutput = _onOutput;
  onExit = _onExit;
  FATAL_FAIL(::fcntl(masterFd, F_SETFL,
                     ::fcntl(masterFd, F_GETFL) | O_NONBLOCK));
  master.assign(masterFd);
  VLOG(1) << "pty opened " << masterFd << " for pid " << pid;

  readOutput();
  waitForExit();
  // The child may already be gone if it exited before the first SIGCHLD
  // wait was armed.
  auto self = shared_from_this();
  boost::asio::post(ioContext, [this, self]() {
    if (!closed && !exited) {
      checkExited();
    }
  });
  return pid;
}

void PosixPseudoTerminal::readOutput() {
  auto self = shared_from_this();
  master.async_read_some(
      boost::asio::buffer(readBuffer),
      [this, self](const boost::system::error_code &ec, size_t length) {
        if (closed) {
          return;
        }
        if (ec) {
          // Linux reports EIO once every slave fd is closed.  The exit
          // itself is reported through SIGCHLD.
          VLOG(1) << "Terminal read ended for pid " << pid << ": "
                  << ec.message();
          return;
        }
        onOutput(string(readBuffer.data(), length));
        if (!closed) {
          readOutput();
        }
      });
}

void PosixPseudoTerminal::drainOutput() {
  while (!closed) {
    ssize_t rc = ::read(master.native_handle(), readBuffer.data(),
                        readBuffer.size());
    if (rc <= 0) {
      break;
    }
    onOutput(string(readBuffer.data(), rc));
  }
}

void PosixPseudoTerminal::write(const string &data) {
  if (closed || exited || data.empty()) {
    return;
  }
  pendingWrites.push_back(data);
  if (!writing) {
    writeNext();
  }
}

void PosixPseudoTerminal::writeNext() {
  if (closed || pendingWrites.empty()) {
    writing = false;
    return;
  }
  writing = true;
  auto self = shared_from_this();
  boost::asio::async_write(
      master, boost::asio::buffer(pendingWrites.front()),
      [this, self](const boost::system::error_code &ec, size_t) {
        if (closed) {
          return;
        }
        if (ec) {
          LOG(WARNING) << "Write to terminal of pid " << pid
                       << " failed: " << ec.message();
          pendingWrites.clear();
          writing = false;
          return;
        }
        pendingWrites.pop_front();
        writeNext();
      });
}

void PosixPseudoTerminal::resize(int cols, int rows) {
  if (closed || exited) {
    return;
  }
  winsize win;
  memset(&win, 0, sizeof(winsize));
  win.ws_col = cols;
  win.ws_row = rows;
  if (::ioctl(master.native_handle(), TIOCSWINSZ, &win) == -1) {
    LOG(WARNING) << "Resize failed for pid " << pid << ": "
                 << strerror(GetErrno());
  }
}

void PosixPseudoTerminal::kill(int signum) {
  if (pid <= 0 || exited) {
    return;
  }
  if (::kill(pid, signum) == -1 && GetErrno() != ESRCH) {
    LOG(ERROR) << "Could not deliver signal " << signum << " to pid " << pid
               << ": " << strerror(GetErrno());
  }
}

void PosixPseudoTerminal::waitForExit() {
  auto self = shared_from_this();
  childSignals.async_wait(
      [this, self](const boost::system::error_code &ec, int) {
        if (ec || closed || exited) {
          return;
        }
        if (!checkExited()) {
          waitForExit();
        }
      });
}

bool PosixPseudoTerminal::checkExited() {
  int status = 0;
  pid_t rc = ::waitpid(pid, &status, WNOHANG);
  if (rc == 0) {
    return false;
  }
  if (rc == -1) {
    if (GetErrno() == EINTR) {
      return false;
    }
    STERROR << "waitpid failed for pid " << pid << ": "
            << strerror(GetErrno());
    status = 0;
  }
  exited = true;

  int exitCode = 0;
  optional<int> signalNumber;
  if (rc != -1 && WIFSIGNALED(status)) {
    signalNumber = WTERMSIG(status);
    exitCode = 128 + WTERMSIG(status);
  } else if (rc != -1 && WIFEXITED(status)) {
    exitCode = WEXITSTATUS(status);
  } else {
    exitCode = -1;
  }
  LOG(INFO) << "Process " << pid << " exited with code " << exitCode;

  drainOutput();
  if (!closed) {
    // The callback may destroy the owner; hold a copy.
    ExitCallback callback = onExit;
    callback(exitCode, signalNumber);
  }
  return true;
}

void PosixPseudoTerminal::close() {
  if (closed) {
    return;
  }
  closed = true;
  boost::system::error_code ec;
  childSignals.cancel(ec);
  if (master.is_open()) {
    master.close(ec);
  }
  pendingWrites.clear();
}
}  // namespace wt
