#pragma once

#include <string>
#include <memory>
#include <functional>
#include <torctl/common/api_macro.hpp>

namespace torctl::logger {

enum TORCTL_API Level : int {
  trace = 0,
  debug,
  info,
  warn,
  error,
  critical,
  off,
};

using LoggerCb =
    std::function<void(const char* filename, int line, const char* funcname,
                       Level, const std::string& msg)>;

/**
 * @brief Diagnostics sink. Passed explicitly to the operations that report
 * non-fatal events (unexpected protocol version, unknown authentication
 * methods, failed cookie path resolution). A default constructed Logger
 * discards everything.
 */
class TORCTL_API Logger final {
 public:
  Logger() noexcept = default;
  Logger(LoggerCb logger_cb, Level lvl) noexcept;

  Level GetLevel() const noexcept;
  void SetLevel(Level lvl) noexcept;

  /**
   * @brief Check if a message of the given level would be delivered.
   */
  bool ShouldLog(Level lvl) const noexcept;

  void Log(const char* filename, int line, const char* funcname, Level lvl,
           const std::string& msg) const noexcept;

 private:
  std::shared_ptr<LoggerCb> logger_cb_;
  Level lvl_{Level::off};
};

/**
 * @brief Create a logger that discards all messages.
 */
TORCTL_API Logger MakeNullLogger() noexcept;

/**
 * @brief Create a logger that outputs the result to stdout.
 *
 * @param lvl current log level.
 * @return Logger
 * @throws std::exception
 */
TORCTL_API Logger MakeStdoutLogger(Level lvl);

/**
 * @brief Create a logger that outputs the result to file.
 *
 * @param log_path path to log file.
 * @param lvl current log level.
 * @return Logger
 * @throws std::exception
 */
TORCTL_API Logger MakeFileLogger(const std::string& log_path, Level lvl);

/**
 * @brief Create a logger that forwards every message to a callback.
 *
 * @param logger_cb callback that will be called for logging.
 * @param lvl current log level.
 */
TORCTL_API Logger MakeCallbackLogger(LoggerCb logger_cb, Level lvl) noexcept;

}  // namespace torctl::logger
