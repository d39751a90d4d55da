#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace hr {
LogSettings LogSettings::daemon(const string& directory, bool toStdout) {
  LogSettings settings;
  settings.directory = directory;
  settings.filenamePrefix = "hookrelayd";
  settings.toStdout = toStdout;
  settings.threadName = string("hookrelayd-main");
  settings.rollOut = true;
  return settings;
}

LogSettings LogSettings::emitter(const string& directory) {
  LogSettings settings;
  settings.directory = directory;
  settings.filenamePrefix = "hookrelay-emit";
  // Many emitters can start within the same second.
  settings.appendPid = true;
  return settings;
}

LogSettings LogSettings::testRunner(const string& directory) {
  LogSettings settings;
  settings.directory = directory;
  settings.filenamePrefix = "log";
  settings.redirectStderr = true;
  return settings;
}

el::Configurations LogHandler::setupLogHandler(int* argc, char*** argv) {
  // Verbosity comes from cxxopts, not from easylogging's own argv parsing.
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
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupStdoutLogger() {
  el::Logger* stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::apply(el::Configurations* defaultConf,
                       const LogSettings& settings) {
  if (settings.silent || settings.directory.empty()) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
    defaultConf->setGlobally(el::ConfigurationType::ToFile, "false");
    defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  } else {
    time_t now = time(NULL);
    optional<pid_t> pid;
    if (settings.appendPid) {
      pid = getpid();
    }
    string fullFname = createLogFile(
        settings.directory,
        logFilename(settings.filenamePrefix, now, pid));

    el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
    defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
    defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
    defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                             settings.maxLogSize);
    defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                             settings.toStdout ? "true" : "false");

    if (settings.redirectStderr) {
      stderrToFile(settings.directory,
                   logFilename(settings.filenamePrefix + "-stderr", now, pid));
    }
  }

  if (settings.verbose) {
    el::Loggers::setVerboseLevel(*settings.verbose);
  }
  el::Loggers::reconfigureLogger("default", *defaultConf);
  if (settings.threadName) {
    el::Helpers::setThreadName(*settings.threadName);
  }
  if (settings.rollOut) {
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  }
}

void LogHandler::shutdown() { el::Helpers::uninstallPreRollOutCallback(); }

string LogHandler::logFilename(const string& prefix, time_t when,
                               optional<pid_t> pid) {
  char buffer[80];
  struct tm timeinfo;
  localtime_r(&when, &timeinfo);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);
  string filename = prefix + "-" + buffer;
  if (pid) {
    filename.append("_" + to_string(*pid));
  }
  return filename + ".log";
}

string LogHandler::createLogFile(const string& path, const string& filename) {
  string fullFname = path + "/" + filename;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " + path + ": " +
                             ec.message());
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd < 0) {
    throw std::runtime_error("Cannot create log file " + fullFname + ": " +
                             strerror(GetErrno()));
  }
  FATAL_FAIL(::close(fd));
  return fullFname;
}

void LogHandler::rolloutHandler(const char* filename, std::size_t size) {
  string previous = string(filename) + ".1";
  if (::rename(filename, previous.c_str()) == -1) {
    // Nowhere to report it; fall back to dropping the full file.
    ::remove(filename);
  }
}

void LogHandler::stderrToFile(const string& path,
                              const string& stderrFilename) {
  string fullFname = createLogFile(path, stderrFilename);
  FILE* stderr_stream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderr_stream) {
    STFATAL << "Invalid filename " << stderrFilename;
  }
  setvbuf(stderr_stream, NULL, _IOLBF, BUFSIZ);  // set to line buffering
}
}  // namespace hr
