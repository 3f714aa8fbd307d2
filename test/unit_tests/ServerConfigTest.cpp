#include "ServerConfig.hpp"

#include "SimpleIni.h"
#include "TestHeaders.hpp"

using namespace wt;

namespace {
void applyIni(const string &text, ServerConfig *config) {
  CSimpleIniA ini(true, false, false);
  REQUIRE(ini.LoadData(text.c_str(), text.size()) >= 0);
  applyConfigFile(ini, config);
}
}  // namespace

TEST_CASE("ServerConfig defaults", "[ServerConfig]") {
  ServerConfig config;
  REQUIRE(config.relayPort == 3001);
  REQUIRE(config.controlPort == 3003);
  REQUIRE(config.bindIp == "0.0.0.0");
  REQUIRE(config.primaryBinary == "claude");
  REQUIRE(config.secondaryBinary == "codex");
  REQUIRE(config.scrollbackLines == 5000);
  REQUIRE(config.stopGraceMs == 5000);
  REQUIRE(config.defaultCols == 120);
  REQUIRE(config.defaultRows == 30);
  REQUIRE(config.heartbeatSeconds == 30);
}

TEST_CASE("ServerConfig reads every section", "[ServerConfig]") {
  ServerConfig config;
  applyIni(
      "[Networking]\n"
      "port = 4001\n"
      "control_port = 4003\n"
      "bind_ip = 127.0.0.1\n"
      "[Agents]\n"
      "primary_binary = /opt/claude/bin/claude\n"
      "secondary_binary = codex-cli\n"
      "preferred_shell = /bin/zsh\n"
      "data_dir = /var/lib/webterm\n"
      "[Sessions]\n"
      "scrollback_lines = 100\n"
      "stop_grace_ms = 250\n"
      "default_cols = 80\n"
      "default_rows = 24\n"
      "[Relay]\n"
      "heartbeat_seconds = 5\n"
      "max_queued_kb = 512\n"
      "[Debug]\n"
      "verbose = 3\n"
      "silent = 1\n"
      "logsize = 1048576\n",
      &config);

  REQUIRE(config.relayPort == 4001);
  REQUIRE(config.controlPort == 4003);
  REQUIRE(config.bindIp == "127.0.0.1");
  REQUIRE(config.primaryBinary == "/opt/claude/bin/claude");
  REQUIRE(config.secondaryBinary == "codex-cli");
  REQUIRE(config.preferredShell == "/bin/zsh");
  REQUIRE(config.dataDir == "/var/lib/webterm");
  REQUIRE(config.scrollbackLines == 100);
  REQUIRE(config.stopGraceMs == 250);
  REQUIRE(config.defaultCols == 80);
  REQUIRE(config.defaultRows == 24);
  REQUIRE(config.heartbeatSeconds == 5);
  REQUIRE(config.maxQueuedKilobytes == 512);
  REQUIRE(config.verbose == 3);
  REQUIRE(config.silent);
  REQUIRE(config.maxLogSize == "1048576");
}

TEST_CASE("ServerConfig keeps values missing from the file",
          "[ServerConfig]") {
  ServerConfig config;
  config.relayPort = 9000;
  applyIni("[Relay]\nheartbeat_seconds = 10\n", &config);
  REQUIRE(config.relayPort == 9000);
  REQUIRE(config.heartbeatSeconds == 10);
}

TEST_CASE("ServerConfig rejects bad values", "[ServerConfig]") {
  ServerConfig config;
  REQUIRE_THROWS(applyIni("[Networking]\nport = abc\n", &config));
  REQUIRE_THROWS(applyIni("[Sessions]\nscrollback_lines = 0\n", &config));

  SECTION("Non-positive timings") {
    REQUIRE_THROWS_AS(applyIni("[Relay]\nheartbeat_seconds = 0\n", &config),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(applyIni("[Sessions]\nstop_grace_ms = -5\n", &config),
                      std::invalid_argument);
    REQUIRE(config.heartbeatSeconds == 30);
    REQUIRE(config.stopGraceMs == 5000);
  }

  SECTION("Geometry out of range") {
    REQUIRE_THROWS(applyIni("[Sessions]\ndefault_cols = 0\n", &config));
    REQUIRE_THROWS(applyIni("[Sessions]\ndefault_rows = 70000\n", &config));
  }

  SECTION("Ports out of range") {
    REQUIRE_THROWS(applyIni("[Networking]\nport = -1\n", &config));
    REQUIRE_THROWS(applyIni("[Networking]\ncontrol_port = 65536\n", &config));
  }
}

TEST_CASE("ServerConfig loads a file", "[ServerConfig]") {
  string dirPattern = GetTempDirectory() + string("wt_config_XXXXXXXX");
  string dir = string(mkdtemp(&dirPattern[0]));
  string filename = dir + "/wtserver.cfg";

  SECTION("Missing file") {
    ServerConfig config;
    REQUIRE_THROWS_AS(loadConfigFile(filename, &config), std::runtime_error);
  }

  SECTION("Valid file") {
    {
      ofstream out(filename);
      out << "[Networking]\nport = 5555\n";
    }
    ServerConfig config;
    loadConfigFile(filename, &config);
    REQUIRE(config.relayPort == 5555);
  }

  SECTION("Invalid value") {
    {
      ofstream out(filename);
      out << "[Sessions]\nstop_grace_ms = soon\n";
    }
    ServerConfig config;
    REQUIRE_THROWS_AS(loadConfigFile(filename, &config), std::runtime_error);
  }

  SECTION("Zero heartbeat") {
    {
      ofstream out(filename);
      out << "[Relay]\nheartbeat_seconds = 0\n";
    }
    ServerConfig config;
    REQUIRE_THROWS_AS(loadConfigFile(filename, &config), std::runtime_error);
  }

  fs::remove_all(dir);
}
