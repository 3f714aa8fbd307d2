#ifndef __WT_RELAY_SERVER__
#define __WT_RELAY_SERVER__

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "CollaborationChannel.hpp"
#include "Headers.hpp"
#include "RelayConnection.hpp"
#include "SessionManager.hpp"
#include "TerminalChannel.hpp"

namespace wt {
struct RelayServerOptions {
  string bindIp = "0.0.0.0";
  /** @brief 0 picks an ephemeral port, see getPort(). */
  int port = DEFAULT_RELAY_PORT;
  std::chrono::milliseconds heartbeatInterval =
      std::chrono::seconds(DEFAULT_HEARTBEAT_SECONDS);
  /** @brief Per-connection cap on unsent output. */
  size_t maxQueuedBytes = DEFAULT_MAX_QUEUED_BYTES;
};

/**
 * @brief Single listener for both realtime channels.
 *
 * Upgrade requests are dispatched by path: `/ws` and `/ws/terminal` to the
 * terminal channel, `/ws/collab` to the collaboration channel.  Anything else
 * is answered with a 404 before the upgrade.
 */
class RelayServer {
 public:
  RelayServer(boost::asio::io_context &_ioContext,
              SessionManager &_sessionManager,
              const RelayServerOptions &_options);
  ~RelayServer();

  /** @brief Binds the listener and starts accepting and sweeping. */
  void start();

  /** @brief Port the listener is bound to. */
  int getPort() const;

  /**
   * @brief Stops the sweep, terminates every connection and closes the
   * listener.  `onClosed` runs on the loop once the listener is closed.
   */
  void shutdown(function<void()> onClosed);

  /** @brief Channel served at `path`, if any. */
  static optional<ChannelKind> channelForPath(const string &path);

  /**
   * @brief Hands a freshly upgraded connection to its channel.
   * @returns false if the channel rejected the connection parameters.
   */
  bool openConnection(shared_ptr<RelayConnection> connection,
                      const map<string, string> &params);
  void handleMessage(shared_ptr<RelayConnection> connection,
                     const string &text);
  void handleConnectionClosed(const string &connectionId);

  /**
   * @brief One liveness pass: connections that did not answer the previous
   * ping are terminated, the rest are pinged again.
   */
  void sweepConnections();

  size_t getConnectionCount() const { return connections.size(); }
  size_t getConnectionCount(const SessionKey &key) const {
    return terminalChannel.getConnectionCount(key);
  }
  TerminalChannel &getTerminalChannel() { return terminalChannel; }
  CollaborationChannel &getCollaborationChannel() {
    return collaborationChannel;
  }
  string nextConnectionId();

 protected:
  /** @brief An accepted socket whose HTTP upgrade request is being read. */
  struct UpgradeSession {
    boost::beast::tcp_stream stream;
    boost::beast::flat_buffer buffer;
    boost::beast::http::request<boost::beast::http::string_body> request;

    explicit UpgradeSession(boost::asio::ip::tcp::socket &&socket)
        : stream(std::move(socket)) {}
  };

  boost::asio::io_context &ioContext;
  /** @brief Source of the events the terminal channel fans out. */
  SessionManager &sessionManager;
  RelayServerOptions options;
  /** @brief Listener shared by both channels. */
  boost::asio::ip::tcp::acceptor acceptor;
  /** @brief Fires every `options.heartbeatInterval` to run a sweep. */
  boost::asio::steady_timer sweepTimer;
  TerminalChannel terminalChannel;
  CollaborationChannel collaborationChannel;
  /** @brief Every open connection of either channel, by connection id. */
  map<string, shared_ptr<RelayConnection>> connections;
  /** @brief Last number handed out by nextConnectionId(). */
  int64_t connectionCounter;
  /** @brief The terminal channel is subscribed to `sessionManager`. */
  bool subscribed;
  /** @brief shutdown() ran; no new connections are taken. */
  bool stopped;

  void doAccept();
  /** @brief Reads the HTTP request of a new socket, giving up after 30s. */
  void readUpgrade(shared_ptr<UpgradeSession> session);
  /** @brief Upgrades to a WebSocket or refuses the request. */
  void handleUpgrade(shared_ptr<UpgradeSession> session);
  /** @brief Answers 404 and shuts the socket down. */
  void rejectUpgrade(shared_ptr<UpgradeSession> session);
  void scheduleSweep();
};
}  // namespace wt

#endif  // __WT_RELAY_SERVER__
