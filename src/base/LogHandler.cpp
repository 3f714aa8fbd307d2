#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace wt {
namespace {
string logTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm local;
  localtime_r(&now, &local);
  std::ostringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d_%H-%M-%S") << "_" << getpid();
  return ss.str();
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts and the config file, not from easylogging's
  // own argument parsing.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread prints the name set by setThreadName
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const LogFileOptions &fileOptions) {
  string stamp = logTimestamp();
  string logFile = createLogFile(fileOptions.directory,
                                 fileOptions.prefix + "-" + stamp + ".log");

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logFile);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           fileOptions.maxFileSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           fileOptions.toStdout ? "true" : "false");

  if (fileOptions.redirectStderr) {
    string stderrFile =
        createLogFile(fileOptions.directory,
                      fileOptions.prefix + "-stderr-" + stamp + ".log");
    FILE *stderrStream = freopen(stderrFile.c_str(), "w", stderr);
    if (!stderrStream) {
      STFATAL << "Could not redirect stderr to " << stderrFile;
    }
    setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
  }
  return logFile;
}

void LogHandler::setVerbosity(el::Configurations *defaultConf, int level,
                              bool silent) {
  el::Loggers::setVerboseLevel(level);
  if (silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t) {
  // The log file is closed while this runs, so no logging here.
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << directory
                          << ": " << ec.message() << endl;
    exit(1);
  }
  string fullName = (fs::path(directory) / filename).string();
  int fd = ::open(fullName.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullName;
}
}  // namespace wt
