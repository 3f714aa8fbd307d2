#include "WebSocketConnection.hpp"

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

namespace wt {
WebSocketConnection::WebSocketConnection(const string &_id,
                                         ChannelKind _channel,
                                         beast::tcp_stream &&stream,
                                         size_t _maxQueuedBytes)
    : RelayConnection(_id, _channel),
      ws(std::move(stream)),
      queuedBytes(0),
      maxQueuedBytes(_maxQueuedBytes),
      writing(false),
      closing(false),
      finished(false) {}

void WebSocketConnection::accept(
    const UpgradeRequest &request,
    function<void(const boost::system::error_code &)> onAccepted) {
  // The relay does its own liveness sweep, so no keep-alive pings here.
  beast::get_lowest_layer(ws).expires_never();
  ws.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws.set_option(websocket::stream_base::decorator(
      [](websocket::response_type &response) {
        response.set(beast::http::field::server,
                     string("wtserver/") + WT_VERSION);
      }));
  auto self = shared_from_this();
  ws.control_callback([this](websocket::frame_type kind, beast::string_view) {
    if (kind == websocket::frame_type::pong) {
      setAlive(true);
    }
  });
  ws.async_accept(request,
                  [self, onAccepted](const boost::system::error_code &ec) {
                    onAccepted(ec);
                  });
}

void WebSocketConnection::setHandlers(MessageHandler _onMessage,
                                      CloseHandler _onClose) {
  onMessage = _onMessage;
  onClose = _onClose;
}

void WebSocketConnection::startReading() { doRead(); }

void WebSocketConnection::send(const string &text) {
  if (closing || finished) {
    VLOG(2) << "Dropping frame for closing connection " << id;
    return;
  }
  // A frame larger than the cap still goes out on an idle connection.
  if (queuedBytes > 0 && queuedBytes + text.size() > maxQueuedBytes) {
    LOG(WARNING) << "Connection " << id << " is not draining ("
                 << queuedBytes << " bytes queued), terminating";
    terminate();
    return;
  }
  queuedBytes += text.size();
  enqueue(WriteKind::TEXT, text);
}

void WebSocketConnection::ping() {
  if (closing || finished) {
    return;
  }
  enqueue(WriteKind::PING, "");
}

void WebSocketConnection::close() {
  if (closing || finished) {
    return;
  }
  closing = true;
  enqueue(WriteKind::CLOSE, "");
}

void WebSocketConnection::terminate() {
  if (finished) {
    return;
  }
  boost::system::error_code ec;
  beast::get_lowest_layer(ws).socket().close(ec);
  if (ec) {
    VLOG(1) << "Error closing socket for " << id << ": " << ec.message();
  }
  finish("terminated");
}

void WebSocketConnection::enqueue(WriteKind kind, const string &text) {
  pendingWrites.push_back(PendingWrite{kind, text});
  if (!writing) {
    doWrite();
  }
}

void WebSocketConnection::doRead() {
  auto self = shared_from_this();
  ws.async_read(readBuffer, [self](const boost::system::error_code &ec,
                                   size_t) {
    if (ec) {
      if (ec == websocket::error::closed) {
        self->finish("closed by peer");
      } else {
        self->finish(ec.message());
      }
      return;
    }
    string text = beast::buffers_to_string(self->readBuffer.data());
    self->readBuffer.consume(self->readBuffer.size());
    if (self->finished) {
      return;
    }
    if (self->onMessage) {
      self->onMessage(text);
    }
    if (!self->finished) {
      self->doRead();
    }
  });
}

void WebSocketConnection::doWrite() {
  if (pendingWrites.empty() || finished) {
    writing = false;
    return;
  }
  writing = true;
  auto self = shared_from_this();
  PendingWrite &next = pendingWrites.front();
  switch (next.kind) {
    case WriteKind::TEXT:
      ws.text(true);
      ws.async_write(boost::asio::buffer(next.text),
                     [self](const boost::system::error_code &ec, size_t) {
                       self->onWriteComplete(ec);
                     });
      break;
    case WriteKind::PING:
      ws.async_ping({}, [self](const boost::system::error_code &ec) {
        self->onWriteComplete(ec);
      });
      break;
    case WriteKind::CLOSE:
      ws.async_close(websocket::close_code::normal,
                     [self](const boost::system::error_code &ec) {
                       self->finish(ec ? ec.message() : "closed");
                     });
      break;
  }
}

void WebSocketConnection::onWriteComplete(
    const boost::system::error_code &ec) {
  if (!pendingWrites.empty()) {
    queuedBytes -= pendingWrites.front().text.size();
    pendingWrites.pop_front();
  }
  if (ec) {
    finish(ec.message());
    return;
  }
  doWrite();
}

void WebSocketConnection::finish(const string &reason) {
  if (finished) {
    return;
  }
  finished = true;
  VLOG(1) << "Connection " << id << " finished: " << reason;
  boost::system::error_code ec;
  beast::get_lowest_layer(ws).socket().close(ec);
  if (onClose) {
    CloseHandler handler = onClose;
    onClose = nullptr;
    onMessage = nullptr;
    handler(id);
  }
}
}  // namespace wt
