#include "ControlPlaneServer.hpp"

#include "FakePseudoTerminal.hpp"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
class ControlPlaneFixture {
 public:
  ControlPlaneFixture()
      : factory(new FakePseudoTerminalFactory()),
        resolver(new FakeExecutableResolver()),
        manager(ioContext, factory, resolver,
                std::make_shared<SessionEnvironment>(nullptr, nullptr),
                SessionManagerOptions()),
        controlPlane(ioContext, manager) {}

  string startBody() const {
    return dumpJson({{"projectPath", GetTempDirectory()}});
  }

  boost::asio::io_context ioContext;
  shared_ptr<FakePseudoTerminalFactory> factory;
  shared_ptr<FakeExecutableResolver> resolver;
  SessionManager manager;
  ControlPlaneServer controlPlane;
};
}  // namespace

TEST_CASE_METHOD(ControlPlaneFixture, "ControlPlaneServer start",
                 "[ControlPlaneServer]") {
  SECTION("Missing projectPath") {
    auto response = controlPlane.handleStart("s1", KIND_CLAUDE, "{}");
    REQUIRE(response.status == 400);
    REQUIRE(response.body["error"] == "projectPath is required");
    REQUIRE(controlPlane.handleStart("s1", KIND_CLAUDE, "").status == 400);
  }

  SECTION("Body that is not JSON") {
    auto response = controlPlane.handleStart("s1", KIND_CLAUDE, "{oops");
    REQUIRE(response.status == 400);
  }

  SECTION("Starts with the requested geometry and env") {
    json body = {{"projectPath", GetTempDirectory()},
                 {"config",
                  {{"cols", 160}, {"rows", 48}, {"env", {{"DEBUG", "1"}}}}},
                 {"userId", "alice"}};
    auto response =
        controlPlane.handleStart("s1", KIND_SHELL, dumpJson(body));
    REQUIRE(response.status == 200);
    REQUIRE(response.body["success"] == true);
    REQUIRE(response.body["pid"] == factory->last()->pid);
    REQUIRE(factory->last()->request.cols == 160);
    REQUIRE(factory->last()->request.rows == 48);
    REQUIRE(factory->last()->request.environment.at("DEBUG") == "1");
    REQUIRE(manager.isRunning("s1", KIND_SHELL));
  }

  SECTION("Geometry out of range") {
    for (const json &config :
         {json{{"cols", 70000}}, json{{"rows", 0}}, json{{"cols", "wide"}}}) {
      json body = {{"projectPath", GetTempDirectory()}, {"config", config}};
      auto response =
          controlPlane.handleStart("s1", KIND_SHELL, dumpJson(body));
      REQUIRE(response.status == 400);
    }
    REQUIRE(factory->terminals.empty());
    REQUIRE_FALSE(manager.isRunning("s1", KIND_SHELL));
  }

  SECTION("Already running") {
    REQUIRE(controlPlane.handleStart("s1", KIND_CLAUDE, startBody()).status ==
            200);
    auto response = controlPlane.handleStart("s1", KIND_CLAUDE, startBody());
    REQUIRE(response.status == 400);
    REQUIRE(response.body["error"] == "Session already running");
  }

  SECTION("Spawn failure") {
    resolver->found = false;
    auto response = controlPlane.handleStart("s1", KIND_CODEX, startBody());
    REQUIRE(response.status == 500);
    REQUIRE_FALSE(response.body["error"].get<string>().empty());
  }
}

TEST_CASE_METHOD(ControlPlaneFixture, "ControlPlaneServer stop and status",
                 "[ControlPlaneServer]") {
  SECTION("Status of an idle session") {
    auto response = controlPlane.handleStatus("s1", KIND_CLAUDE);
    REQUIRE(response.status == 200);
    REQUIRE(response.body["running"] == false);
    REQUIRE(response.body["status"] == "idle");
    REQUIRE(response.body["pid"].is_null());
  }

  SECTION("Status of a running session") {
    controlPlane.handleStart("s1", KIND_CLAUDE, startBody());
    auto response = controlPlane.handleStatus("s1", KIND_CLAUDE);
    REQUIRE(response.body["running"] == true);
    REQUIRE(response.body["status"] == "running");
    REQUIRE(response.body["pid"] == factory->last()->pid);
  }

  SECTION("Stop of an idle session") {
    auto response = controlPlane.handleStop("s1", KIND_CLAUDE, "");
    REQUIRE(response.status == 400);
    REQUIRE(response.body["error"] == "Session not running");
  }

  SECTION("Graceful and forced stop") {
    controlPlane.handleStart("s1", KIND_CLAUDE, startBody());
    auto response = controlPlane.handleStop("s1", KIND_CLAUDE, "");
    REQUIRE(response.status == 200);
    REQUIRE(response.body["success"] == true);
    REQUIRE(factory->last()->signals == vector<int>({SIGTERM}));
    REQUIRE(controlPlane.handleStatus("s1", KIND_CLAUDE).body["status"] ==
            "stopping");

    controlPlane.handleStop("s1", KIND_CLAUDE, R"({"force":true})");
    REQUIRE(factory->last()->signals == vector<int>({SIGTERM, SIGKILL}));
  }
}

TEST_CASE_METHOD(ControlPlaneFixture, "ControlPlaneServer over HTTP",
                 "[ControlPlaneServer]") {
  auto work = boost::asio::make_work_guard(ioContext);
  thread loop([this]() { ioContext.run(); });
  controlPlane.start("127.0.0.1", 0);
  REQUIRE(controlPlane.getPort() > 0);
  httplib::Client client("127.0.0.1", controlPlane.getPort());

  SECTION("Routes select the terminal kind") {
    auto res = client.Post("/sessions/s1/shell/start", startBody(),
                           "application/json");
    REQUIRE(res);
    REQUIRE(res->status == 200);
    REQUIRE(res->get_header_value("Access-Control-Allow-Origin") == "*");

    res = client.Get("/sessions/s1/shell/status");
    REQUIRE(res);
    REQUIRE(json::parse(res->body)["running"] == true);
    res = client.Get("/sessions/s1/status");
    REQUIRE(json::parse(res->body)["running"] == false);
    res = client.Get("/sessions/s1/codex/status");
    REQUIRE(json::parse(res->body)["status"] == "idle");

    res = client.Post("/sessions/s1/shell/stop", R"({"force":true})",
                      "application/json");
    REQUIRE(res->status == 200);
    res = client.Post("/sessions/s1/codex/stop", "", "application/json");
    REQUIRE(res->status == 400);
  }

  SECTION("Unknown routes") {
    auto res = client.Get("/sessions");
    REQUIRE(res);
    REQUIRE(res->status == 404);
    REQUIRE(json::parse(res->body)["error"] == "Not found");
    REQUIRE(res->get_header_value("Access-Control-Allow-Origin") == "*");
  }

  SECTION("Preflight") {
    auto res = client.Options("/sessions/s1/start");
    REQUIRE(res);
    REQUIRE(res->status == 204);
    REQUIRE(res->has_header("Access-Control-Allow-Methods"));
  }

  controlPlane.stop();
  work.reset();
  ioContext.stop();
  loop.join();
}
