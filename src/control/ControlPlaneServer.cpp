#include "ControlPlaneServer.hpp"

#include "SessionKey.hpp"

namespace wt {
namespace {
const std::chrono::seconds LOOP_TIMEOUT(10);

void addCorsHeaders(httplib::Response &res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

void reply(httplib::Response &res, const ControlPlaneResponse &response) {
  addCorsHeaders(res);
  res.status = response.status;
  res.set_content(dumpJson(response.body), "application/json");
}

ControlPlaneResponse errorResponse(int status, const string &message) {
  return ControlPlaneResponse{status, json{{"error", message}}};
}

struct KindRoute {
  const char *prefix;
  TerminalKind kind;
};

const KindRoute KIND_ROUTES[] = {
    {"", KIND_CLAUDE},
    {"/shell", KIND_SHELL},
    {"/codex", KIND_CODEX},
};
}  // namespace

ControlPlaneServer::ControlPlaneServer(boost::asio::io_context &_ioContext,
                                       SessionManager &_sessionManager)
    : ioContext(_ioContext), sessionManager(_sessionManager), boundPort(-1) {
  installRoutes();
}

ControlPlaneServer::~ControlPlaneServer() { stop(); }

void ControlPlaneServer::start(const string &host, int port) {
  if (port == 0) {
    boundPort = server.bind_to_any_port(host.c_str());
  } else if (server.bind_to_port(host.c_str(), port)) {
    boundPort = port;
  }
  if (boundPort <= 0) {
    throw std::runtime_error("Could not bind control plane to " + host + ":" +
                             to_string(port));
  }
  LOG(INFO) << "Control plane listening on " << host << ":" << boundPort;
  serverThread.reset(new thread([this]() {
    el::Helpers::setThreadName("wtserver-http");
    if (!server.listen_after_bind()) {
      LOG(ERROR) << "Control plane stopped listening";
    }
  }));
}

void ControlPlaneServer::stop() {
  if (!serverThread) {
    return;
  }
  server.stop();
  serverThread->join();
  serverThread.reset();
  LOG(INFO) << "Control plane stopped";
}

ControlPlaneResponse ControlPlaneServer::handleStart(const string &sessionId,
                                                     TerminalKind kind,
                                                     const string &body) {
  json request = json::object();
  if (!body.empty()) {
    try {
      request = json::parse(body);
    } catch (const json::parse_error &) {
      return errorResponse(400, "Invalid JSON body");
    }
  }
  if (!request.is_object() || !request.contains("projectPath") ||
      !request["projectPath"].is_string() ||
      request["projectPath"].get<string>().empty()) {
    return errorResponse(400, "projectPath is required");
  }
  string projectPath = request["projectPath"].get<string>();

  SessionConfig config;
  if (request.contains("config") && request["config"].is_object()) {
    const json &c = request["config"];
    for (const char *field : {"cols", "rows"}) {
      if (!c.contains(field)) {
        continue;
      }
      const json &value = c[field];
      if (!value.is_number_integer() || value.get<int64_t>() <= 0 ||
          value.get<int64_t>() > MAX_TERMINAL_DIMENSION) {
        return errorResponse(400, string("config.") + field +
                                      " must be an integer between 1 and " +
                                      to_string(MAX_TERMINAL_DIMENSION));
      }
    }
    if (c.contains("cols")) {
      config.set_cols(c["cols"].get<int>());
    }
    if (c.contains("rows")) {
      config.set_rows(c["rows"].get<int>());
    }
    if (c.contains("env") && c["env"].is_object()) {
      for (auto &it : c["env"].items()) {
        if (it.value().is_string()) {
          (*config.mutable_env())[it.key()] = it.value().get<string>();
        }
      }
    }
  }
  if (request.contains("userId") && request["userId"].is_string()) {
    config.set_user_id(request["userId"].get<string>());
  }

  try {
    pid_t pid = sessionManager.start(sessionId, projectPath, config, kind);
    return ControlPlaneResponse{200, json{{"success", true}, {"pid", pid}}};
  } catch (const SessionError &se) {
    if (se.getCode() == SessionErrorCode::ALREADY_RUNNING) {
      return errorResponse(400, "Session already running");
    }
    return errorResponse(500, se.what());
  }
}

ControlPlaneResponse ControlPlaneServer::handleStop(const string &sessionId,
                                                    TerminalKind kind,
                                                    const string &body) {
  bool force = false;
  if (!body.empty()) {
    json request;
    try {
      request = json::parse(body);
    } catch (const json::parse_error &) {
      return errorResponse(400, "Invalid JSON body");
    }
    if (request.is_object() && request.contains("force") &&
        request["force"].is_boolean()) {
      force = request["force"].get<bool>();
    }
  }
  if (!sessionManager.isRunning(sessionId, kind)) {
    return errorResponse(400, "Session not running");
  }
  sessionManager.stop(sessionId, kind, force);
  return ControlPlaneResponse{200, json{{"success", true}}};
}

ControlPlaneResponse ControlPlaneServer::handleStatus(const string &sessionId,
                                                      TerminalKind kind) {
  json body = {
      {"running", sessionManager.isRunning(sessionId, kind)},
      {"status", sessionStatusName(sessionManager.getStatus(sessionId, kind))},
      {"pid", nullptr}};
  auto pid = sessionManager.getPid(sessionId, kind);
  if (pid) {
    body["pid"] = *pid;
  }
  return ControlPlaneResponse{200, body};
}

ControlPlaneResponse ControlPlaneServer::runOnLoop(
    function<ControlPlaneResponse()> handler) {
  auto task =
      std::make_shared<std::packaged_task<ControlPlaneResponse()>>(handler);
  auto result = task->get_future();
  boost::asio::post(ioContext, [task]() { (*task)(); });
  if (result.wait_for(LOOP_TIMEOUT) != std::future_status::ready) {
    LOG(ERROR) << "Timed out waiting for the event loop";
    return errorResponse(503, "Server busy");
  }
  try {
    return result.get();
  } catch (const std::exception &e) {
    STERROR << "Control plane handler failed: " << e.what();
    return errorResponse(500, e.what());
  }
}

void ControlPlaneServer::installRoutes() {
  for (const auto &route : KIND_ROUTES) {
    string base = string(R"(/sessions/([^/]+))") + route.prefix;
    TerminalKind kind = route.kind;
    server.Post(base + "/start", [this, kind](const httplib::Request &req,
                                              httplib::Response &res) {
      string sessionId = req.matches[1];
      string body = req.body;
      VLOG(1) << "POST start " << SessionKey(sessionId, kind);
      reply(res, runOnLoop([this, sessionId, kind, body]() {
              return handleStart(sessionId, kind, body);
            }));
    });
    server.Post(base + "/stop", [this, kind](const httplib::Request &req,
                                             httplib::Response &res) {
      string sessionId = req.matches[1];
      string body = req.body;
      VLOG(1) << "POST stop " << SessionKey(sessionId, kind);
      reply(res, runOnLoop([this, sessionId, kind, body]() {
              return handleStop(sessionId, kind, body);
            }));
    });
    server.Get(base + "/status", [this, kind](const httplib::Request &req,
                                              httplib::Response &res) {
      string sessionId = req.matches[1];
      reply(res, runOnLoop([this, sessionId, kind]() {
              return handleStatus(sessionId, kind);
            }));
    });
  }

  server.Options(R"(.*)",
                 [](const httplib::Request &, httplib::Response &res) {
                   addCorsHeaders(res);
                   res.status = 204;
                 });

  server.set_error_handler(
      [](const httplib::Request &req, httplib::Response &res) {
        if (!res.has_header("Access-Control-Allow-Origin")) {
          addCorsHeaders(res);
        }
        if (res.body.empty()) {
          string message = res.status == 404 ? "Not found" : "Request failed";
          res.set_content(dumpJson(json{{"error", message}}),
                          "application/json");
        }
        VLOG(1) << req.method << " " << req.path << " -> " << res.status;
      });
}
}  // namespace wt
