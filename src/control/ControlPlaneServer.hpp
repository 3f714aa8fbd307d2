#ifndef __WT_CONTROL_PLANE_SERVER__
#define __WT_CONTROL_PLANE_SERVER__

#include <boost/asio.hpp>
#include <future>

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionManager.hpp"
#include "httplib.h"

namespace wt {
struct ControlPlaneResponse {
  int status;
  json body;
};

/**
 * @brief HTTP/JSON start, stop and status endpoints for the web tier.
 *
 * Requests are served on the HTTP library's threads, but every session
 * manager call is posted onto the event loop and awaited there.
 */
class ControlPlaneServer {
 public:
  ControlPlaneServer(boost::asio::io_context &_ioContext,
                     SessionManager &_sessionManager);
  ~ControlPlaneServer();

  /** @brief Binds `host:port` (0 for any free port) and serves on a thread. */
  void start(const string &host, int port);
  void stop();
  int getPort() const { return boundPort; }

  // Handlers below touch the session manager directly and must run on the
  // loop thread.
  ControlPlaneResponse handleStart(const string &sessionId, TerminalKind kind,
                                   const string &body);
  ControlPlaneResponse handleStop(const string &sessionId, TerminalKind kind,
                                  const string &body);
  ControlPlaneResponse handleStatus(const string &sessionId,
                                    TerminalKind kind);

 protected:
  boost::asio::io_context &ioContext;
  SessionManager &sessionManager;
  httplib::Server server;
  unique_ptr<thread> serverThread;
  int boundPort;

  void installRoutes();
  ControlPlaneResponse runOnLoop(function<ControlPlaneResponse()> handler);
};
}  // namespace wt

#endif  // __WT_CONTROL_PLANE_SERVER__
