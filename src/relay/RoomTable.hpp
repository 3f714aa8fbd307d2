#ifndef __WT_ROOM_TABLE__
#define __WT_ROOM_TABLE__

#include "Headers.hpp"
#include "RelayConnection.hpp"

namespace wt {
/**
 * @brief Rooms of connections keyed by `Key`.  Empty rooms are pruned.
 */
template <typename Key>
class RoomTable {
 public:
  typedef map<string, shared_ptr<RelayConnection>> Room;

  void join(const Key &key, shared_ptr<RelayConnection> connection) {
    rooms[key][connection->getId()] = connection;
  }

  /** @returns true if the connection was a member. */
  bool leave(const Key &key, const string &connectionId) {
    auto it = rooms.find(key);
    if (it == rooms.end()) {
      return false;
    }
    bool removed = it->second.erase(connectionId) > 0;
    if (it->second.empty()) {
      rooms.erase(it);
    }
    return removed;
  }

  /** @brief Members of the room in join-id order; empty if no room. */
  vector<shared_ptr<RelayConnection>> members(const Key &key) const {
    vector<shared_ptr<RelayConnection>> result;
    auto it = rooms.find(key);
    if (it != rooms.end()) {
      for (const auto &member : it->second) {
        result.push_back(member.second);
      }
    }
    return result;
  }

  /** @brief Sends `text` to every member except `excludeId`. */
  void broadcast(const Key &key, const string &text,
                 const string &excludeId = "") const {
    // Copy first: a send that fails may close the connection and leave.
    for (const auto &member : members(key)) {
      if (member->getId() != excludeId) {
        member->send(text);
      }
    }
  }

  bool hasRoom(const Key &key) const { return rooms.find(key) != rooms.end(); }

  size_t roomSize(const Key &key) const {
    auto it = rooms.find(key);
    return it == rooms.end() ? 0 : it->second.size();
  }

  size_t roomCount() const { return rooms.size(); }

  size_t connectionCount() const {
    size_t total = 0;
    for (const auto &it : rooms) {
      total += it.second.size();
    }
    return total;
  }

 protected:
  map<Key, Room> rooms;
};
}  // namespace wt

#endif  // __WT_ROOM_TABLE__
