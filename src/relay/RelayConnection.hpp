#ifndef __WT_RELAY_CONNECTION__
#define __WT_RELAY_CONNECTION__

#include "Headers.hpp"

namespace wt {
enum class ChannelKind { TERMINAL, COLLABORATION };

/**
 * @brief One realtime client as seen by the channels.
 *
 * The transport is abstract so the channel logic can be driven by a fake in
 * tests; WebSocketConnection is the production implementation.
 */
class RelayConnection {
 public:
  RelayConnection(const string &_id, ChannelKind _channel)
      : id(_id), channel(_channel), alive(true) {}
  virtual ~RelayConnection() {}

  const string &getId() const { return id; }
  ChannelKind getChannel() const { return channel; }

  /** @brief Cleared before each liveness ping, set again by the pong. */
  bool isAlive() const { return alive; }
  void setAlive(bool _alive) { alive = _alive; }

  /** @brief Queues a text frame.  Dropped if the connection is closing. */
  virtual void send(const string &text) = 0;
  /** @brief Sends a protocol level ping. */
  virtual void ping() = 0;
  /** @brief Flushes queued frames, then closes with a normal close frame. */
  virtual void close() = 0;
  /** @brief Drops the connection immediately. */
  virtual void terminate() = 0;

 protected:
  string id;
  ChannelKind channel;
  bool alive;
};
}  // namespace wt

#endif  // __WT_RELAY_CONNECTION__
