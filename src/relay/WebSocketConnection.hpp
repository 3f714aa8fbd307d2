#ifndef __WT_WEB_SOCKET_CONNECTION__
#define __WT_WEB_SOCKET_CONNECTION__

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "Headers.hpp"
#include "RelayConnection.hpp"

namespace wt {
/**
 * @brief A RelayConnection over a Boost.Beast WebSocket.
 *
 * Frames are queued and written one at a time.  The close handler fires
 * exactly once, whichever way the connection ends.
 */
class WebSocketConnection
    : public RelayConnection,
      public std::enable_shared_from_this<WebSocketConnection> {
 public:
  typedef boost::beast::websocket::stream<boost::beast::tcp_stream>
      WebSocketStream;
  typedef boost::beast::http::request<boost::beast::http::string_body>
      UpgradeRequest;
  typedef function<void(const string &)> MessageHandler;
  typedef function<void(const string &)> CloseHandler;

  /**
   * @param _maxQueuedBytes Text bytes that may wait for the socket.  A send
   * that would exceed it while frames are still waiting terminates the
   * connection instead.
   */
  WebSocketConnection(const string &_id, ChannelKind _channel,
                      boost::beast::tcp_stream &&stream,
                      size_t _maxQueuedBytes = DEFAULT_MAX_QUEUED_BYTES);
  virtual ~WebSocketConnection() {}

  /** @brief Completes the WebSocket handshake for an upgrade request. */
  void accept(const UpgradeRequest &request,
              function<void(const boost::system::error_code &)> onAccepted);

  /** @brief Installs the handlers.  Must be called before anything is sent. */
  void setHandlers(MessageHandler _onMessage, CloseHandler _onClose);
  /** @brief Starts the read loop. */
  void startReading();

  virtual void send(const string &text);
  virtual void ping();
  virtual void close();
  virtual void terminate();

  size_t getQueuedBytes() const { return queuedBytes; }

 protected:
  enum class WriteKind { TEXT, PING, CLOSE };
  struct PendingWrite {
    WriteKind kind;
    string text;
  };

  WebSocketStream ws;
  boost::beast::flat_buffer readBuffer;
  /** @brief Frames waiting for the socket.  The front one is in flight while
   * `writing` is set. */
  deque<PendingWrite> pendingWrites;
  /** @brief Sum of the text sizes in `pendingWrites`. */
  size_t queuedBytes;
  size_t maxQueuedBytes;
  MessageHandler onMessage;
  /** @brief Cleared once it has been called. */
  CloseHandler onClose;
  /** @brief A write or close is outstanding on `ws`. */
  bool writing;
  /** @brief close() was called; only queued frames still go out. */
  bool closing;
  /** @brief The socket is closed and onClose has fired. */
  bool finished;

  /** @brief Queues a frame and starts writing if nothing is in flight. */
  void enqueue(WriteKind kind, const string &text);
  void doRead();
  /** @brief Writes the front frame of `pendingWrites`. */
  void doWrite();
  void onWriteComplete(const boost::system::error_code &ec);
  /** @brief Closes the socket and fires onClose.  Runs at most once. */
  void finish(const string &reason);
};
}  // namespace wt

#endif  // __WT_WEB_SOCKET_CONNECTION__
