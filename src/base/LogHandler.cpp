#include "LogHandler.hpp"

#include <iomanip>

INITIALIZE_EASYLOGGINGPP

namespace burrow {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts/the config file, easylogging only gets argv
  // for its own --v flags.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  // Never write to stdout unless asked, it carries the json protocol
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const BurrowConfig &config,
                                 const string &directory, bool logToStdout,
                                 bool redirectStderr) {
  el::Loggers::setVerboseLevel(config.verbose);
  if (config.silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }

  string logPath = createLogFile(directory, logFileName("burrowd"));
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           config.maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  if (redirectStderr) {
    string stderrPath =
        createLogFile(directory, logFileName("burrowd-stderr"));
    FILE *stderrStream = freopen(stderrPath.c_str(), "w", stderr);
    if (!stderrStream) {
      STFATAL << "Cannot redirect stderr to " << stderrPath;
    }
    setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
  }
  return logPath;
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

string LogHandler::logFileName(const string &prefix) {
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  std::ostringstream ss;
  ss << prefix << "-" << std::put_time(&local, "%Y%m%d-%H%M%S") << "-"
     << getpid() << ".log";
  return ss.str();
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, so nothing may be logged
  remove(filename);
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
  string fullPath = (fs::path(directory) / filename).string();
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullPath;
}
}  // namespace burrow
