#include "TerminalChannel.hpp"

#include "RelayMessages.hpp"

namespace wt {
TerminalChannel::TerminalChannel(SessionManager &_sessionManager)
    : sessionManager(_sessionManager) {}

bool TerminalChannel::handleOpen(shared_ptr<RelayConnection> connection,
                                 const map<string, string> &params) {
  auto it = params.find("sessionId");
  if (it == params.end() || it->second.empty()) {
    reject(connection, "MISSING_SESSION_ID", "sessionId is required");
    return false;
  }
  string sessionId = it->second;

  TerminalKind kind = KIND_CLAUDE;
  auto kindIt = params.find("terminalKind");
  if (kindIt == params.end()) {
    kindIt = params.find("terminalType");
  }
  if (kindIt != params.end() && !kindIt->second.empty()) {
    auto parsed = parseTerminalKind(kindIt->second);
    if (!parsed) {
      reject(connection, "INVALID_TERMINAL_KIND",
             "Unknown terminal kind: " + kindIt->second);
      return false;
    }
    kind = *parsed;
  }

  SessionKey key(sessionId, kind);
  rooms.join(key, connection);
  members[connection->getId()] = key;
  LOG(INFO) << "Connection " << connection->getId() << " joined " << key
            << " (" << rooms.roomSize(key) << " viewers)";

  connection->send(encodeConnectionEstablished(sessionId));
  auto scrollback = sessionManager.getScrollback(sessionId, kind);
  if (!scrollback.empty()) {
    connection->send(encodeScrollback(scrollback));
  }
  optional<int> pid;
  auto sessionPid = sessionManager.getPid(sessionId, kind);
  if (sessionPid) {
    pid = int(*sessionPid);
  }
  connection->send(
      encodeStatus(sessionManager.getStatus(sessionId, kind), pid, nullopt));
  return true;
}

void TerminalChannel::handleMessage(shared_ptr<RelayConnection> connection,
                                    const string &text) {
  auto it = members.find(connection->getId());
  if (it == members.end()) {
    VLOG(1) << "Message from unknown connection " << connection->getId();
    return;
  }
  const SessionKey key = it->second;

  TerminalClientMessage message;
  try {
    message = decodeTerminalMessage(text);
  } catch (const MessageError &me) {
    VLOG(1) << "Rejected message from " << connection->getId() << ": "
            << me.what();
    connection->send(encodeError(me.getCode(), me.what()));
    return;
  }

  switch (message.payload_case()) {
    case TerminalClientMessage::kInput:
      try {
        sessionManager.write(key.sessionId, key.kind, message.input().data());
      } catch (const SessionError &se) {
        if (se.getCode() != SessionErrorCode::NOT_FOUND) {
          throw;
        }
        connection->send(
            encodeSessionError("SESSION_NOT_RUNNING", "Session not running"));
      }
      break;
    case TerminalClientMessage::kResize:
      sessionManager.resize(key.sessionId, key.kind, message.resize().cols(),
                            message.resize().rows());
      break;
    case TerminalClientMessage::kSignalRequest:
      sessionManager.sendSignal(key.sessionId, key.kind,
                                message.signal_request().signal_kind());
      break;
    case TerminalClientMessage::kPing:
      connection->send(encodePong());
      break;
    case TerminalClientMessage::PAYLOAD_NOT_SET:
      STFATAL << "Decoded an empty terminal message";
  }
}

void TerminalChannel::handleClose(const string &connectionId) {
  auto it = members.find(connectionId);
  if (it == members.end()) {
    return;
  }
  SessionKey key = it->second;
  members.erase(it);
  rooms.leave(key, connectionId);
  LOG(INFO) << "Connection " << connectionId << " left " << key;
}

void TerminalChannel::onSessionEvent(const SessionEvent &event) {
  SessionKey key(event.session_id(), event.kind());
  if (!rooms.hasRoom(key)) {
    return;
  }
  switch (event.payload_case()) {
    case SessionEvent::kOutput:
      rooms.broadcast(key, encodeOutput(event.output().data(),
                                        event.output().timestamp_ms()));
      break;
    case SessionEvent::kStarted:
      rooms.broadcast(key, encodeStatus(STATUS_RUNNING,
                                        event.started().pid(), nullopt));
      break;
    case SessionEvent::kExited:
      rooms.broadcast(key, encodeStatus(STATUS_IDLE, nullopt,
                                        event.exited().exit_code()));
      break;
    case SessionEvent::kFailure:
      rooms.broadcast(key, encodeSessionError(event.failure().code(),
                                              event.failure().message()));
      break;
    case SessionEvent::PAYLOAD_NOT_SET:
      STFATAL << "Session event without payload for " << key;
  }
}

void TerminalChannel::reject(shared_ptr<RelayConnection> connection,
                             const string &code, const string &message) {
  LOG(WARNING) << "Rejecting connection " << connection->getId() << ": "
               << message;
  connection->send(encodeError(code, message));
  connection->close();
}
}  // namespace wt
