#ifndef __WT_TERMINAL_CHANNEL__
#define __WT_TERMINAL_CHANNEL__

#include "Headers.hpp"
#include "RelayConnection.hpp"
#include "RoomTable.hpp"
#include "SessionManager.hpp"

namespace wt {
/**
 * @brief The terminal half of the relay: one room per session key, fed by
 * the session manager's event stream.
 */
class TerminalChannel : public SessionEventListener {
 public:
  explicit TerminalChannel(SessionManager &_sessionManager);

  /**
   * @brief Validates the connection parameters and joins the room.
   *
   * On success the connection receives `connection:established`, the
   * scrollback if there is any, and the current status, in that order.
   * @returns false if the parameters were rejected and the connection closed.
   */
  bool handleOpen(shared_ptr<RelayConnection> connection,
                  const map<string, string> &params);
  void handleMessage(shared_ptr<RelayConnection> connection,
                     const string &text);
  void handleClose(const string &connectionId);

  virtual void onSessionEvent(const SessionEvent &event);

  size_t getConnectionCount() const { return members.size(); }
  size_t getConnectionCount(const SessionKey &key) const {
    return rooms.roomSize(key);
  }
  bool hasRoom(const SessionKey &key) const { return rooms.hasRoom(key); }

 protected:
  SessionManager &sessionManager;
  /** @brief Viewers of each terminal. */
  RoomTable<SessionKey> rooms;
  /** @brief Terminal each joined connection is watching, by connection id. */
  map<string, SessionKey> members;

  /** @brief Sends an error frame, then closes the connection. */
  void reject(shared_ptr<RelayConnection> connection, const string &code,
              const string &message);
};
}  // namespace wt

#endif  // __WT_TERMINAL_CHANNEL__
