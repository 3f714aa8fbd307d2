#include "SessionManager.hpp"

#include "StringUtils.hpp"

namespace wt {
namespace {
bool validDimension(int value) {
  return value > 0 && value <= MAX_TERMINAL_DIMENSION;
}
}  // namespace

SessionManager::SessionManager(
    boost::asio::io_context &_ioContext,
    shared_ptr<PseudoTerminalFactory> _terminalFactory,
    shared_ptr<ExecutableResolver> _executableResolver,
    shared_ptr<SessionEnvironment> _sessionEnvironment,
    const SessionManagerOptions &_options)
    : ioContext(_ioContext),
      terminalFactory(_terminalFactory),
      executableResolver(_executableResolver),
      sessionEnvironment(_sessionEnvironment),
      options(_options) {}

SessionManager::~SessionManager() {
  for (auto &it : handles) {
    auto &handle = it.second;
    if (handle->escalationTimer) {
      handle->escalationTimer->cancel();
    }
    handle->terminal->kill(SIGKILL);
    handle->terminal->close();
  }
  handles.clear();
}

pid_t SessionManager::start(const string &sessionId, const string &workDir,
                            const SessionConfig &config, TerminalKind kind) {
  SessionKey key(sessionId, kind);
  if (handles.find(key) != handles.end()) {
    throw SessionError(SessionErrorCode::ALREADY_RUNNING,
                       "Session " + sessionId + " (" +
                           terminalKindName(kind) + ") already running");
  }

  try {
    std::error_code ec;
    if (workDir.empty() || !fs::is_directory(workDir, ec)) {
      throw SessionError(SessionErrorCode::INVALID_WORK_DIR,
                         "Working directory does not exist: " + workDir);
    }
    auto executable = executableResolver->resolve(kind);
    if (!executable) {
      throw SessionError(SessionErrorCode::EXECUTABLE_NOT_FOUND,
                         "No executable found for terminal kind " +
                             terminalKindName(kind));
    }

    SpawnRequest request;
    request.executable = *executable;
    request.workDir = workDir;
    request.cols = config.has_cols() && validDimension(config.cols())
                       ? config.cols()
                       : options.defaultCols;
    request.rows = config.has_rows() && validDimension(config.rows())
                       ? config.rows()
                       : options.defaultRows;
    request.environment = sessionEnvironment->build(kind, config);

    auto handle = std::make_shared<SessionHandle>(options.maxScrollbackLines);
    handle->key = key;
    handle->workDir = workDir;
    handle->cols = request.cols;
    handle->rows = request.rows;
    handle->status = STATUS_STARTING;
    handle->startedAt = handle->lastActivityAt =
        std::chrono::system_clock::now();
    handle->terminal = terminalFactory->create();

    weak_ptr<SessionHandle> weakHandle = handle;
    handle->pid = handle->terminal->spawn(
        request,
        [this, weakHandle](const string &chunk) {
          handleOutput(weakHandle, chunk);
        },
        [this, weakHandle](int exitCode, optional<int> signalNumber) {
          handleExit(weakHandle, exitCode, signalNumber);
        });
    handle->status = STATUS_RUNNING;
    handles[key] = handle;
    LOG(INFO) << "Started " << key << " as pid " << handle->pid << " ("
              << request.executable << " in " << workDir << ")";

    SessionEvent event = makeEvent(key);
    event.mutable_started()->set_pid(handle->pid);
    publish(event);
    return handle->pid;
  } catch (const SessionError &se) {
    LOG(ERROR) << "Failed to start " << key << ": " << se.what();
    publishFailure(key, se);
    throw;
  }
}

void SessionManager::write(const string &sessionId, TerminalKind kind,
                           const string &data) {
  auto handle = find(SessionKey(sessionId, kind));
  if (!handle) {
    throw SessionError(SessionErrorCode::NOT_FOUND,
                       "Session " + sessionId + " (" +
                           terminalKindName(kind) + ") not found");
  }
  handle->lastActivityAt = std::chrono::system_clock::now();
  handle->terminal->write(data);
}

void SessionManager::resize(const string &sessionId, TerminalKind kind,
                            int cols, int rows) {
  auto handle = find(SessionKey(sessionId, kind));
  if (!handle) {
    VLOG(1) << "Ignoring resize for missing session " << sessionId;
    return;
  }
  if (!validDimension(cols) || !validDimension(rows)) {
    LOG(WARNING) << "Ignoring invalid geometry " << cols << "x" << rows;
    return;
  }
  handle->cols = cols;
  handle->rows = rows;
  handle->terminal->resize(cols, rows);
}

void SessionManager::sendSignal(const string &sessionId, TerminalKind kind,
                                TerminalSignal signal) {
  auto handle = find(SessionKey(sessionId, kind));
  if (!handle) {
    VLOG(1) << "Ignoring signal for missing session " << sessionId;
    return;
  }
  VLOG(1) << "Sending " << terminalSignalName(signal) << " to "
          << handle->key;
  handle->terminal->kill(toPosixSignal(signal));
}

void SessionManager::stop(const string &sessionId, TerminalKind kind,
                          bool force) {
  auto handle = find(SessionKey(sessionId, kind));
  if (!handle) {
    return;
  }
  handle->status = STATUS_STOPPING;
  if (force) {
    LOG(INFO) << "Killing " << handle->key;
    if (handle->escalationTimer) {
      handle->escalationTimer->cancel();
    }
    handle->terminal->kill(SIGKILL);
    return;
  }

  LOG(INFO) << "Terminating " << handle->key;
  handle->terminal->kill(SIGTERM);
  if (handle->escalationTimer) {
    // Already counting down from an earlier stop
    return;
  }
  handle->escalationTimer.reset(
      new boost::asio::steady_timer(ioContext, options.stopGracePeriod));
  weak_ptr<SessionHandle> weakHandle = handle;
  handle->escalationTimer->async_wait(
      [this, weakHandle](const boost::system::error_code &ec) {
        if (ec) {
          return;
        }
        auto handle = weakHandle.lock();
        if (!handle || find(handle->key) != handle) {
          return;
        }
        LOG(WARNING) << handle->key
                     << " ignored SIGTERM, escalating to SIGKILL";
        handle->terminal->kill(SIGKILL);
      });
}

void SessionManager::shutdownAll() {
  vector<SessionKey> keys = getRunningSessions();
  LOG(INFO) << "Stopping " << keys.size() << " sessions";
  for (const auto &key : keys) {
    stop(key.sessionId, key.kind, true);
  }
}

vector<string> SessionManager::getScrollback(const string &sessionId,
                                             TerminalKind kind) const {
  auto handle = find(SessionKey(sessionId, kind));
  if (!handle) {
    return {};
  }
  return handle->scrollback.snapshot();
}

SessionStatus SessionManager::getStatus(const string &sessionId,
                                        TerminalKind kind) const {
  auto handle = find(SessionKey(sessionId, kind));
  return handle ? handle->status : STATUS_IDLE;
}

optional<pid_t> SessionManager::getPid(const string &sessionId,
                                       TerminalKind kind) const {
  auto handle = find(SessionKey(sessionId, kind));
  if (!handle) {
    return nullopt;
  }
  return handle->pid;
}

bool SessionManager::isRunning(const string &sessionId,
                               TerminalKind kind) const {
  return find(SessionKey(sessionId, kind)) != nullptr;
}

optional<SessionInfo> SessionManager::getInfo(const SessionKey &key) const {
  auto handle = find(key);
  if (!handle) {
    return nullopt;
  }
  SessionInfo info;
  info.key = handle->key;
  info.pid = handle->pid;
  info.workDir = handle->workDir;
  info.cols = handle->cols;
  info.rows = handle->rows;
  info.status = handle->status;
  info.startedAt = handle->startedAt;
  info.lastActivityAt = handle->lastActivityAt;
  info.scrollbackLines = handle->scrollback.size();
  return info;
}

vector<SessionKey> SessionManager::getRunningSessions() const {
  vector<SessionKey> keys;
  for (const auto &it : handles) {
    keys.push_back(it.first);
  }
  return keys;
}

void SessionManager::subscribe(SessionEventListener *listener) {
  listeners.push_back(listener);
}

void SessionManager::unsubscribe(SessionEventListener *listener) {
  listeners.erase(std::remove(listeners.begin(), listeners.end(), listener),
                  listeners.end());
}

shared_ptr<SessionManager::SessionHandle> SessionManager::find(
    const SessionKey &key) const {
  auto it = handles.find(key);
  if (it == handles.end()) {
    return nullptr;
  }
  return it->second;
}

void SessionManager::handleOutput(const weak_ptr<SessionHandle> &weakHandle,
                                  const string &chunk) {
  auto handle = weakHandle.lock();
  if (!handle) {
    return;
  }
  string data = handle->pendingUtf8 + chunk;
  size_t complete = utf8CompletePrefixLength(data);
  handle->pendingUtf8 = data.substr(complete);
  data.resize(complete);
  if (data.empty()) {
    return;
  }
  publishOutput(handle.get(), data);
}

void SessionManager::handleExit(const weak_ptr<SessionHandle> &weakHandle,
                                int exitCode, optional<int> signalNumber) {
  auto handle = weakHandle.lock();
  if (!handle) {
    return;
  }
  if (!handle->pendingUtf8.empty()) {
    string rest;
    rest.swap(handle->pendingUtf8);
    publishOutput(handle.get(), rest);
  }
  if (handle->escalationTimer) {
    handle->escalationTimer->cancel();
  }
  handle->status = STATUS_IDLE;
  auto it = handles.find(handle->key);
  if (it != handles.end() && it->second == handle) {
    handles.erase(it);
  }
  handle->terminal->close();
  LOG(INFO) << handle->key << " exited with code " << exitCode;

  SessionEvent event = makeEvent(handle->key);
  event.mutable_exited()->set_exit_code(exitCode);
  if (signalNumber) {
    event.mutable_exited()->set_signal_number(*signalNumber);
  }
  publish(event);
}

void SessionManager::publishOutput(SessionHandle *handle, const string &data) {
  handle->lastActivityAt = std::chrono::system_clock::now();
  handle->scrollback.append(data);
  SessionEvent event = makeEvent(handle->key);
  event.mutable_output()->set_data(data);
  event.mutable_output()->set_timestamp_ms(nowMillis());
  publish(event);
}

void SessionManager::publishFailure(const SessionKey &key,
                                    const SessionError &error) {
  if (!error.isSpawnFailure()) {
    return;
  }
  SessionEvent event = makeEvent(key);
  event.mutable_failure()->set_code("PTY_ERROR");
  event.mutable_failure()->set_message(error.what());
  publish(event);
}

void SessionManager::publish(const SessionEvent &event) {
  // Listeners may unsubscribe while handling an event.
  auto currentListeners = listeners;
  for (auto *listener : currentListeners) {
    listener->onSessionEvent(event);
  }
}

SessionEvent SessionManager::makeEvent(const SessionKey &key) const {
  SessionEvent event;
  event.set_session_id(key.sessionId);
  event.set_kind(key.kind);
  return event;
}
}  // namespace wt
