#include "RelayServer.hpp"

#include <boost/beast/websocket.hpp>

#include "JsonLib.hpp"
#include "StringUtils.hpp"
#include "WebSocketConnection.hpp"

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

namespace wt {
RelayServer::RelayServer(asio::io_context &_ioContext,
                         SessionManager &_sessionManager,
                         const RelayServerOptions &_options)
    : ioContext(_ioContext),
      sessionManager(_sessionManager),
      options(_options),
      acceptor(_ioContext),
      sweepTimer(_ioContext),
      terminalChannel(_sessionManager),
      connectionCounter(0),
      subscribed(false),
      stopped(false) {}

RelayServer::~RelayServer() {
  if (subscribed) {
    sessionManager.unsubscribe(&terminalChannel);
  }
}

void RelayServer::start() {
  tcp::endpoint endpoint(asio::ip::make_address(options.bindIp),
                         static_cast<unsigned short>(options.port));
  acceptor.open(endpoint.protocol());
  acceptor.set_option(asio::socket_base::reuse_address(true));
  acceptor.bind(endpoint);
  acceptor.listen(asio::socket_base::max_listen_connections);
  sessionManager.subscribe(&terminalChannel);
  subscribed = true;
  LOG(INFO) << "Relay listening on " << options.bindIp << ":" << getPort();
  doAccept();
  scheduleSweep();
}

int RelayServer::getPort() const {
  boost::system::error_code ec;
  auto endpoint = acceptor.local_endpoint(ec);
  if (ec) {
    return -1;
  }
  return endpoint.port();
}

void RelayServer::shutdown(function<void()> onClosed) {
  LOG(INFO) << "Shutting down relay with " << connections.size()
            << " open connections";
  stopped = true;
  sweepTimer.cancel();
  // Terminating a connection removes it from the map.
  auto openConnections = connections;
  for (auto &it : openConnections) {
    it.second->terminate();
  }
  boost::system::error_code ec;
  acceptor.close(ec);
  if (ec) {
    LOG(WARNING) << "Error closing relay listener: " << ec.message();
  }
  if (subscribed) {
    sessionManager.unsubscribe(&terminalChannel);
    subscribed = false;
  }
  asio::post(ioContext, onClosed);
}

optional<ChannelKind> RelayServer::channelForPath(const string &path) {
  if (path == "/ws" || path == "/ws/terminal") {
    return ChannelKind::TERMINAL;
  }
  if (path == "/ws/collab") {
    return ChannelKind::COLLABORATION;
  }
  return nullopt;
}

bool RelayServer::openConnection(shared_ptr<RelayConnection> connection,
                                 const map<string, string> &params) {
  connections[connection->getId()] = connection;
  if (connection->getChannel() == ChannelKind::TERMINAL) {
    return terminalChannel.handleOpen(connection, params);
  }
  return collaborationChannel.handleOpen(connection, params);
}

void RelayServer::handleMessage(shared_ptr<RelayConnection> connection,
                                const string &text) {
  if (connection->getChannel() == ChannelKind::TERMINAL) {
    terminalChannel.handleMessage(connection, text);
  } else {
    collaborationChannel.handleMessage(connection, text);
  }
}

void RelayServer::handleConnectionClosed(const string &connectionId) {
  auto it = connections.find(connectionId);
  if (it == connections.end()) {
    return;
  }
  ChannelKind channel = it->second->getChannel();
  connections.erase(it);
  if (channel == ChannelKind::TERMINAL) {
    terminalChannel.handleClose(connectionId);
  } else {
    collaborationChannel.handleClose(connectionId);
  }
}

void RelayServer::sweepConnections() {
  auto openConnections = connections;
  int terminated = 0;
  for (auto &it : openConnections) {
    auto &connection = it.second;
    if (!connection->isAlive()) {
      LOG(INFO) << "Connection " << connection->getId()
                << " missed its heartbeat, terminating";
      connection->terminate();
      terminated++;
      continue;
    }
    connection->setAlive(false);
    connection->ping();
  }
  VLOG(1) << "Liveness sweep: " << openConnections.size() << " connections, "
          << terminated << " terminated";
}

string RelayServer::nextConnectionId() {
  return "conn-" + to_string(++connectionCounter);
}

void RelayServer::doAccept() {
  acceptor.async_accept(
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        if (ec) {
          if (ec != asio::error::operation_aborted) {
            LOG(ERROR) << "Accept failed: " << ec.message();
          }
          if (stopped || !acceptor.is_open()) {
            return;
          }
        } else if (!stopped) {
          readUpgrade(std::make_shared<UpgradeSession>(std::move(socket)));
        }
        if (!stopped) {
          doAccept();
        }
      });
}

void RelayServer::readUpgrade(shared_ptr<UpgradeSession> session) {
  session->stream.expires_after(std::chrono::seconds(30));
  http::async_read(
      session->stream, session->buffer, session->request,
      [this, session](const boost::system::error_code &ec, size_t) {
        if (ec) {
          VLOG(1) << "Dropping connection before upgrade: " << ec.message();
          return;
        }
        if (stopped) {
          return;
        }
        handleUpgrade(session);
      });
}

void RelayServer::handleUpgrade(shared_ptr<UpgradeSession> session) {
  map<string, string> params;
  string target(session->request.target());
  string path = parseRequestTarget(target, &params);
  auto channel = channelForPath(path);
  if (!channel || !websocket::is_upgrade(session->request)) {
    LOG(WARNING) << "Rejecting upgrade for " << path;
    rejectUpgrade(session);
    return;
  }

  auto connection = std::make_shared<WebSocketConnection>(
      nextConnectionId(), *channel, std::move(session->stream),
      options.maxQueuedBytes);
  weak_ptr<WebSocketConnection> weakConnection = connection;
  connection->accept(
      session->request,
      [this, session, connection, weakConnection,
       params](const boost::system::error_code &ec) {
        if (ec) {
          LOG(WARNING) << "WebSocket handshake failed: " << ec.message();
          return;
        }
        if (stopped) {
          connection->terminate();
          return;
        }
        connection->setHandlers(
            [this, weakConnection](const string &text) {
              auto c = weakConnection.lock();
              if (c) {
                handleMessage(c, text);
              }
            },
            [this](const string &connectionId) {
              handleConnectionClosed(connectionId);
            });
        if (openConnection(connection, params)) {
          connection->startReading();
        }
      });
}

void RelayServer::rejectUpgrade(shared_ptr<UpgradeSession> session) {
  auto response = std::make_shared<http::response<http::string_body>>(
      http::status::not_found, session->request.version());
  response->set(http::field::content_type, "application/json");
  response->keep_alive(false);
  response->body() = dumpJson({{"error", "Not found"}});
  response->prepare_payload();
  http::async_write(
      session->stream, *response,
      [session, response](const boost::system::error_code &ec, size_t) {
        if (ec) {
          VLOG(1) << "Error writing rejection: " << ec.message();
        }
        boost::system::error_code shutdownEc;
        session->stream.socket().shutdown(tcp::socket::shutdown_send,
                                          shutdownEc);
      });
}

void RelayServer::scheduleSweep() {
  sweepTimer.expires_after(options.heartbeatInterval);
  sweepTimer.async_wait([this](const boost::system::error_code &ec) {
    if (ec || stopped) {
      return;
    }
    sweepConnections();
    scheduleSweep();
  });
}
}  // namespace wt
