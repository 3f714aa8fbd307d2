#ifndef __WT_COLLABORATION_CHANNEL__
#define __WT_COLLABORATION_CHANNEL__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RelayConnection.hpp"
#include "RoomTable.hpp"

namespace wt {
/**
 * @brief Presence, chat, cursor and typing fan-out for everyone looking at
 * a session, whatever terminal they have open.
 */
class CollaborationChannel {
 public:
  CollaborationChannel() {}

  /** @returns false if sessionId or userId is missing; the connection is
   * closed in that case. */
  bool handleOpen(shared_ptr<RelayConnection> connection,
                  const map<string, string> &params);
  void handleMessage(shared_ptr<RelayConnection> connection,
                     const string &text);
  void handleClose(const string &connectionId);

  /** @brief Roster of the connections in `sessionId` that have joined. */
  json getPresence(const string &sessionId) const;

  size_t getConnectionCount() const { return members.size(); }
  size_t getConnectionCount(const string &sessionId) const {
    return rooms.roomSize(sessionId);
  }
  bool hasRoom(const string &sessionId) const {
    return rooms.hasRoom(sessionId);
  }

 protected:
  /** @brief Presence state of one collaboration connection. */
  struct Collaborator {
    string sessionId;
    string userId;
    /** @brief Set by collab:join; only joined members appear in presence. */
    bool joined = false;
    string name;
    string color;
    /** @brief Milliseconds since the epoch of the last message. */
    int64_t lastSeen = 0;
    bool isTyping = false;
    /** @brief Last cursor payload, passed through as sent. */
    optional<json> cursor;
  };

  /** @brief Connections of each session, joined or not. */
  RoomTable<string> rooms;
  map<string, Collaborator> members;

  void broadcastPresence(const string &sessionId);
};
}  // namespace wt

#endif  // __WT_COLLABORATION_CHANNEL__
