#include <cxxopts.hpp>

#include "ControlPlaneServer.hpp"
#include "ExecutableResolver.hpp"
#include "LogHandler.hpp"
#include "PosixPseudoTerminal.hpp"
#include "RelayServer.hpp"
#include "ServerConfig.hpp"
#include "SessionEnvironment.hpp"
#include "SessionManager.hpp"

using namespace wt;

namespace {
// Polls until every session has been reaped, or gives up after `attempts`.
void stopWhenSessionsExit(boost::asio::io_context &ioContext,
                          SessionManager &sessionManager, int attempts) {
  if (sessionManager.getRunningCount() == 0 || attempts <= 0) {
    if (sessionManager.getRunningCount()) {
      LOG(WARNING) << sessionManager.getRunningCount()
                   << " sessions still running at exit";
    }
    ioContext.stop();
    return;
  }
  auto timer = std::make_shared<boost::asio::steady_timer>(
      ioContext, std::chrono::milliseconds(100));
  timer->async_wait([&ioContext, &sessionManager, attempts,
                     timer](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    stopWhenSessionsExit(ioContext, sessionManager, attempts - 1);
  });
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  wt::HandleTerminate();

  cxxopts::Options options("wtserver",
                           "Browser terminals for AI agents and shells");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port for realtime connections",
         cxxopts::value<int>()->default_value("0"))  //
        ("controlport", "Port for the control plane",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "wtserver version " << WT_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    if (result.count("cfgfile")) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        loadConfigFile(cfgfilename, &config);
      } catch (const std::runtime_error &re) {
        STFATAL << re.what();
      }
    }

    // Command line flags win over the config file
    if (result.count("port")) {
      config.relayPort = result["port"].as<int>();
    }
    if (result.count("controlport")) {
      config.controlPort = result["controlport"].as<int>();
    }
    if (result.count("bindip")) {
      config.bindIp = result["bindip"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    LogHandler::setVerbosity(&defaultConf, config.verbose, config.silent);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LogFileOptions logOptions;
    logOptions.directory = GetTempDirectory();
    logOptions.prefix = "wtserver";
    logOptions.toStdout = result.count("logtostdout") > 0;
    logOptions.redirectStderr = !logOptions.toStdout;
    logOptions.maxFileSize = config.maxLogSize;
    string logFile = LogHandler::setupLogFiles(&defaultConf, logOptions);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("wtserver-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    // A viewer that disconnects mid-write must not kill the server
    ::signal(SIGPIPE, SIG_IGN);

    boost::asio::io_context ioContext;

    SessionManagerOptions sessionOptions;
    sessionOptions.maxScrollbackLines = config.scrollbackLines;
    sessionOptions.stopGracePeriod =
        std::chrono::milliseconds(config.stopGraceMs);
    sessionOptions.defaultCols = config.defaultCols;
    sessionOptions.defaultRows = config.defaultRows;
    SessionManager sessionManager(
        ioContext, std::make_shared<PosixPseudoTerminalFactory>(ioContext),
        std::make_shared<ExecutableResolver>(config.primaryBinary,
                                             config.secondaryBinary,
                                             config.preferredShell),
        std::make_shared<SessionEnvironment>(
            std::make_shared<EnvironmentCredentialResolver>(),
            std::make_shared<DataDirConfigResolver>(config.dataDir)),
        sessionOptions);

    RelayServerOptions relayOptions;
    relayOptions.bindIp = config.bindIp;
    relayOptions.port = config.relayPort;
    relayOptions.heartbeatInterval =
        std::chrono::seconds(config.heartbeatSeconds);
    relayOptions.maxQueuedBytes = size_t(config.maxQueuedKilobytes) * 1024;
    RelayServer relayServer(ioContext, sessionManager, relayOptions);
    relayServer.start();

    ControlPlaneServer controlPlane(ioContext, sessionManager);
    controlPlane.start(config.bindIp, config.controlPort);

    boost::asio::signal_set shutdownSignals(ioContext, SIGINT, SIGTERM);
    shutdownSignals.async_wait([&](const boost::system::error_code &ec,
                                   int signum) {
      if (ec) {
        return;
      }
      LOG(INFO) << "Got signal " << signum << ", shutting down";
      sessionManager.shutdownAll();
      relayServer.shutdown([&]() {
        LOG(INFO) << "Relay closed, waiting for sessions to exit";
        stopWhenSessionsExit(ioContext, sessionManager, 20);
      });
    });

    LOG(INFO) << "wtserver " << WT_VERSION << " started, logging to "
              << logFile;
    ioContext.run();

    controlPlane.stop();
    LOG(INFO) << "wtserver stopped";
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
