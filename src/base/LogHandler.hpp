#ifndef __HR_LOG_HANDLER__
#define __HR_LOG_HANDLER__

#include "Headers.hpp"

namespace hr {
const string DEFAULT_MAX_LOG_SIZE = "20971520";

/**
 * @brief Where and how one HookRelay process logs.
 *
 * The factories encode the policy of each binary; callers only fill in what
 * came from the command line or the config file.
 */
struct LogSettings {
  /** @brief Empty disables logging entirely. */
  string directory;
  string filenamePrefix;
  bool toStdout = false;
  bool redirectStderr = false;
  bool appendPid = false;
  bool silent = false;
  optional<int> verbose;
  string maxLogSize = DEFAULT_MAX_LOG_SIZE;
  /** @brief Set on the calling thread once logging is configured. */
  optional<string> threadName;
  bool rollOut = false;

  /** @brief hookrelayd: long running, rolls its log file over. */
  static LogSettings daemon(const string& directory, bool toStdout);
  /**
   * @brief hookrelay-emit: stdout carries the decision, so it never logs
   * there, and without a directory it does not log at all.
   */
  static LogSettings emitter(const string& directory);
  /** @brief Test runner: everything, stderr included, goes to files. */
  static LogSettings testRunner(const string& directory);
};

/**
 * @brief Configures easylogging++ for HookRelay processes.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that apply() will customize.
   */
  static el::Configurations setupLogHandler(int* argc, char*** argv);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Applies `settings` to `defaultConf` and reconfigures the default
   * logger with it.
   * @throws std::runtime_error if the log directory or file cannot be created.
   */
  static void apply(el::Configurations* defaultConf,
                    const LogSettings& settings);

  /** @brief Undoes the process-wide hooks installed by apply(). */
  static void shutdown();

  /**
   * @brief Name of a log file started at `when`, e.g.
   * `hookrelayd-2026-01-31_23-59-59_1234.log`.
   */
  static string logFilename(const string& prefix, time_t when,
                            optional<pid_t> pid);

  /**
   * @brief Creates a new, private log file. Refuses to reuse or follow an
   * existing path.
   * @throws std::runtime_error on failure.
   */
  static string createLogFile(const string& path, const string& filename);

  /**
   * @brief Keeps one previous generation as `<filename>.1`.
   *
   * Runs while the log file is closed, so it must not log.
   */
  static void rolloutHandler(const char* filename, std::size_t size);

 private:
  static void stderrToFile(const string& path, const string& stderrFilename);
};
}  // namespace hr
#endif  // __HR_LOG_HANDLER__
