#pragma once

#include <string>
#include <fmt/core.h>
#include <torctl/utils/logger_fwd.hpp>
#include <torctl/utils/non_copyable.hpp>
#include <spdlog/spdlog.h>

namespace torctl::logger {

using SpdlogPtr = std::shared_ptr<spdlog::logger>;
using LoggerBasePtr = std::shared_ptr<class LoggerBase>;

class LoggerBase : utils::NonCopyable {
 public:
  static const std::string kDefaultLogFormat;

  explicit LoggerBase(SpdlogPtr logger);

  void SetLogFormat(const std::string& fmt);
  void Flush();
  void Log(const char* filename, int line, const char* funcname, Level lvl,
           const std::string& msg) noexcept;

 private:
  const SpdlogPtr logger_;
};

class FileLogger final : public LoggerBase {
 public:
  explicit FileLogger(const std::string& log_path);
};

class StdoutLogger final : public LoggerBase {
 public:
  static const std::string kName;
  StdoutLogger();
};

Logger MakeLogger(LoggerBasePtr logger, Level lvl);

namespace detail {

inline const std::string& Fmt(const std::string& msg) { return msg; }

template <typename... Args>
std::string Fmt(fmt::format_string<Args...> fmt, Args&&... args) {
  return fmt::format(fmt, std::forward<Args>(args)...);
}

}  // namespace detail

#define TORCTL_LOG_LEVEL(LEVEL) torctl::logger::Level::LEVEL

#define TORCTL_LOG(LOGGER, LEVEL, ...)                                    \
  do {                                                                    \
    try {                                                                 \
      if ((LOGGER).ShouldLog(TORCTL_LOG_LEVEL(LEVEL))) {                  \
        (LOGGER).Log(__FILE__, __LINE__, __func__, TORCTL_LOG_LEVEL(LEVEL), \
                     torctl::logger::detail::Fmt(__VA_ARGS__));           \
      }                                                                   \
    } catch (const std::exception& ex) {                                  \
      (LOGGER).Log(__FILE__, __LINE__, __func__, TORCTL_LOG_LEVEL(LEVEL), \
                   ex.what());                                            \
    }                                                                     \
  } while (0)

}  // namespace torctl::logger
