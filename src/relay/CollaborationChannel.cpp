#include "CollaborationChannel.hpp"

#include "RelayMessages.hpp"

namespace wt {
namespace {
const char *DEFAULT_USER_COLOR = "#3b82f6";

string paramOrEmpty(const map<string, string> &params, const string &name) {
  auto it = params.find(name);
  return it == params.end() ? "" : it->second;
}
}  // namespace

bool CollaborationChannel::handleOpen(shared_ptr<RelayConnection> connection,
                                      const map<string, string> &params) {
  string sessionId = paramOrEmpty(params, "sessionId");
  string userId = paramOrEmpty(params, "userId");
  if (sessionId.empty() || userId.empty()) {
    LOG(WARNING) << "Rejecting collaboration connection "
                 << connection->getId() << ": missing parameters";
    connection->send(
        encodeError("MISSING_PARAMETERS", "sessionId and userId are required"));
    connection->close();
    return false;
  }

  Collaborator collaborator;
  collaborator.sessionId = sessionId;
  collaborator.userId = userId;
  collaborator.lastSeen = nowMillis();
  members[connection->getId()] = collaborator;
  rooms.join(sessionId, connection);
  VLOG(1) << "User " << userId << " connected to collaboration on "
          << sessionId;
  return true;
}

void CollaborationChannel::handleMessage(
    shared_ptr<RelayConnection> connection, const string &text) {
  auto it = members.find(connection->getId());
  if (it == members.end()) {
    VLOG(1) << "Message from unknown connection " << connection->getId();
    return;
  }
  Collaborator &collaborator = it->second;

  CollabClientMessage message;
  try {
    message = decodeCollabMessage(text);
  } catch (const MessageError &me) {
    VLOG(1) << "Rejected message from " << connection->getId() << ": "
            << me.what();
    connection->send(encodeError(me.getCode(), me.what()));
    return;
  }

  collaborator.lastSeen = nowMillis();
  switch (message.payload_case()) {
    case CollabClientMessage::kJoin:
      collaborator.joined = true;
      collaborator.name = message.join().user_name().empty()
                              ? collaborator.userId
                              : message.join().user_name();
      collaborator.color = message.join().user_color().empty()
                               ? DEFAULT_USER_COLOR
                               : message.join().user_color();
      LOG(INFO) << collaborator.name << " joined " << collaborator.sessionId;
      broadcastPresence(collaborator.sessionId);
      break;
    case CollabClientMessage::kChat:
      rooms.broadcast(collaborator.sessionId,
                      encodeCollabRelay(message, collaborator.userId),
                      connection->getId());
      break;
    case CollabClientMessage::kCursor:
      collaborator.cursor = json::parse(message.cursor().cursor_json());
      rooms.broadcast(collaborator.sessionId,
                      encodeCollabRelay(message, collaborator.userId),
                      connection->getId());
      break;
    case CollabClientMessage::kTyping:
      collaborator.isTyping = message.typing().is_typing();
      rooms.broadcast(collaborator.sessionId,
                      encodeCollabRelay(message, collaborator.userId),
                      connection->getId());
      break;
    case CollabClientMessage::kHeartbeat:
      break;
    case CollabClientMessage::kPing:
      connection->send(encodePong());
      break;
    case CollabClientMessage::PAYLOAD_NOT_SET:
      STFATAL << "Decoded an empty collaboration message";
  }
}

void CollaborationChannel::handleClose(const string &connectionId) {
  auto it = members.find(connectionId);
  if (it == members.end()) {
    return;
  }
  string sessionId = it->second.sessionId;
  bool wasJoined = it->second.joined;
  VLOG(1) << "User " << it->second.userId << " left collaboration on "
          << sessionId;
  members.erase(it);
  rooms.leave(sessionId, connectionId);
  if (wasJoined) {
    broadcastPresence(sessionId);
  }
}

json CollaborationChannel::getPresence(const string &sessionId) const {
  json collaborators = json::array();
  for (const auto &connection : rooms.members(sessionId)) {
    auto it = members.find(connection->getId());
    if (it == members.end() || !it->second.joined) {
      continue;
    }
    const Collaborator &c = it->second;
    json entry = {{"id", c.userId},
                  {"name", c.name},
                  {"color", c.color},
                  {"lastSeen", c.lastSeen},
                  {"isTyping", c.isTyping}};
    if (c.cursor) {
      entry["cursor"] = *c.cursor;
    }
    collaborators.push_back(entry);
  }
  return collaborators;
}

void CollaborationChannel::broadcastPresence(const string &sessionId) {
  if (!rooms.hasRoom(sessionId)) {
    return;
  }
  rooms.broadcast(sessionId, encodePresence(getPresence(sessionId)));
}
}  // namespace wt
