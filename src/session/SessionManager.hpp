#ifndef __WT_SESSION_MANAGER__
#define __WT_SESSION_MANAGER__

#include <boost/asio.hpp>

#include "ExecutableResolver.hpp"
#include "Headers.hpp"
#include "PseudoTerminal.hpp"
#include "ScrollbackBuffer.hpp"
#include "SessionEnvironment.hpp"
#include "SessionError.hpp"
#include "SessionKey.hpp"

namespace wt {
/**
 * @brief Consumer of the typed lifecycle events a SessionManager publishes.
 */
class SessionEventListener {
 public:
  virtual ~SessionEventListener() {}
  virtual void onSessionEvent(const SessionEvent &event) = 0;
};

struct SessionManagerOptions {
  size_t maxScrollbackLines = DEFAULT_SCROLLBACK_LINES;
  std::chrono::milliseconds stopGracePeriod =
      std::chrono::milliseconds(DEFAULT_STOP_GRACE_MS);
  int defaultCols = DEFAULT_TERMINAL_COLS;
  int defaultRows = DEFAULT_TERMINAL_ROWS;
};

/** @brief Copy of a handle's attributes, safe to keep after it exits. */
struct SessionInfo {
  SessionKey key;
  pid_t pid = -1;
  string workDir;
  int cols = 0;
  int rows = 0;
  SessionStatus status = STATUS_IDLE;
  std::chrono::system_clock::time_point startedAt;
  std::chrono::system_clock::time_point lastActivityAt;
  size_t scrollbackLines = 0;
};

/**
 * @brief Owns every running terminal process, keyed by (session id,
 * terminal kind).
 *
 * At most one handle exists per key.  A handle is removed when its process
 * exits, and its scrollback goes with it.  All methods must be called from
 * the thread running `ioContext`; events are published on that thread too.
 */
class SessionManager {
 public:
  SessionManager(boost::asio::io_context &_ioContext,
                 shared_ptr<PseudoTerminalFactory> _terminalFactory,
                 shared_ptr<ExecutableResolver> _executableResolver,
                 shared_ptr<SessionEnvironment> _sessionEnvironment,
                 const SessionManagerOptions &_options);
  virtual ~SessionManager();

  /**
   * @brief Spawns the process for `kind` in `workDir`.
   * @returns The process id.
   * @throws SessionError ALREADY_RUNNING if the key has a live handle,
   * INVALID_WORK_DIR, EXECUTABLE_NOT_FOUND or SPAWN_FAILED otherwise.  Spawn
   * failures are also published as a failure event.
   */
  pid_t start(const string &sessionId, const string &workDir,
              const SessionConfig &config, TerminalKind kind);

  /**
   * @brief Forwards raw input to the process.
   * @throws SessionError NOT_FOUND if no handle exists.
   */
  void write(const string &sessionId, TerminalKind kind, const string &data);

  /** @brief Resizes the terminal; does nothing if no handle exists. */
  void resize(const string &sessionId, TerminalKind kind, int cols, int rows);

  /** @brief Delivers a signal; does nothing if no handle exists. */
  void sendSignal(const string &sessionId, TerminalKind kind,
                  TerminalSignal signal);

  /**
   * @brief Asks the process to stop.  Without `force`, SIGTERM is sent and
   * SIGKILL follows after the grace period unless the process exits first.
   * With `force`, SIGKILL is sent right away.
   */
  void stop(const string &sessionId, TerminalKind kind, bool force);

  /** @brief Force-stops every handle. */
  void shutdownAll();

  vector<string> getScrollback(const string &sessionId,
                               TerminalKind kind) const;
  SessionStatus getStatus(const string &sessionId, TerminalKind kind) const;
  optional<pid_t> getPid(const string &sessionId, TerminalKind kind) const;
  bool isRunning(const string &sessionId, TerminalKind kind) const;
  optional<SessionInfo> getInfo(const SessionKey &key) const;
  size_t getRunningCount() const { return handles.size(); }
  vector<SessionKey> getRunningSessions() const;

  /** @brief Registers a listener; it must outlive this manager or be
   * unsubscribed first. */
  void subscribe(SessionEventListener *listener);
  void unsubscribe(SessionEventListener *listener);

 protected:
  /** @brief Everything the manager keeps for one running process. */
  struct SessionHandle {
    SessionKey key;
    /** @brief Directory the process was started in. */
    string workDir;
    pid_t pid = -1;
    /** @brief Geometry last applied to the terminal. */
    int cols = 0;
    int rows = 0;
    SessionStatus status = STATUS_STARTING;
    std::chrono::system_clock::time_point startedAt;
    /** @brief Refreshed by input and by output. */
    std::chrono::system_clock::time_point lastActivityAt;
    /** @brief Recent output, replayed to viewers that join later. */
    ScrollbackBuffer scrollback;
    /** @brief Bytes of a UTF-8 sequence cut off by the previous read. */
    string pendingUtf8;
    shared_ptr<PseudoTerminal> terminal;
    /** @brief Sends SIGKILL when a graceful stop overruns the grace period.
     * Null until the first graceful stop. */
    unique_ptr<boost::asio::steady_timer> escalationTimer;

    explicit SessionHandle(size_t maxLines) : scrollback(maxLines) {}
  };

  /** @brief Loop that runs every terminal callback and timer. */
  boost::asio::io_context &ioContext;
  /** @brief Creates the terminal for each new handle. */
  shared_ptr<PseudoTerminalFactory> terminalFactory;
  /** @brief Maps a terminal kind to the program to run. */
  shared_ptr<ExecutableResolver> executableResolver;
  /** @brief Builds the environment of each spawned process. */
  shared_ptr<SessionEnvironment> sessionEnvironment;
  SessionManagerOptions options;
  /** @brief Live handles.  A handle leaves this map when its process exits. */
  map<SessionKey, shared_ptr<SessionHandle>> handles;
  /** @brief Subscribers, notified in subscription order. */
  vector<SessionEventListener *> listeners;

  shared_ptr<SessionHandle> find(const SessionKey &key) const;
  void handleOutput(const weak_ptr<SessionHandle> &weakHandle,
                    const string &chunk);
  void handleExit(const weak_ptr<SessionHandle> &weakHandle, int exitCode,
                  optional<int> signalNumber);
  void publishOutput(SessionHandle *handle, const string &data);
  void publishFailure(const SessionKey &key, const SessionError &error);
  void publish(const SessionEvent &event);
  SessionEvent makeEvent(const SessionKey &key) const;
};
}  // namespace wt

#endif  // __WT_SESSION_MANAGER__
