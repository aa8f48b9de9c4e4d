#include <utils/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace torctl::logger {

const std::string LoggerBase::kDefaultLogFormat = "[%Y-%m-%d %T.%e][%t][%l] %v";

LoggerBase::LoggerBase(SpdlogPtr logger) : logger_(std::move(logger)) {
  SetLogFormat(kDefaultLogFormat);
  logger_->set_level(spdlog::level::trace);
}

void LoggerBase::SetLogFormat(const std::string& fmt) {
  logger_->set_pattern(fmt);
}

void LoggerBase::Flush() { logger_->flush(); }

void LoggerBase::Log(const char* filename, int line, const char* funcname,
                     Level lvl, const std::string& msg) noexcept {
  try {
    logger_->log(spdlog::source_loc{filename, line, funcname},
                 static_cast<spdlog::level::level_enum>(lvl), msg);
  } catch (const std::exception&) {
  }
}

// spdlog loggers are not registered, so several FileLoggers for the same
// path may coexist.
FileLogger::FileLogger(const std::string& log_path)
    : LoggerBase{std::make_shared<spdlog::logger>(
          log_path,
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path))} {}

const std::string StdoutLogger::kName = "torctl";

StdoutLogger::StdoutLogger()
    : LoggerBase{std::make_shared<spdlog::logger>(
          kName, std::make_shared<spdlog::sinks::stdout_color_sink_mt>())} {}

Logger::Logger(LoggerCb logger_cb, Level lvl) noexcept
    : logger_cb_{logger_cb ? std::make_shared<LoggerCb>(std::move(logger_cb))
                           : nullptr},
      lvl_{lvl} {}

Level Logger::GetLevel() const noexcept { return lvl_; }

void Logger::SetLevel(Level lvl) noexcept { lvl_ = lvl; }

bool Logger::ShouldLog(Level lvl) const noexcept {
  return logger_cb_ && lvl_ != Level::off && lvl >= lvl_;
}

void Logger::Log(const char* filename, int line, const char* funcname,
                 Level lvl, const std::string& msg) const noexcept {
  if (!ShouldLog(lvl)) {
    return;
  }
  try {
    (*logger_cb_)(filename, line, funcname, lvl, msg);
  } catch (const std::exception&) {
  }
}

Logger MakeLogger(LoggerBasePtr logger, Level lvl) {
  return Logger{[logger = std::move(logger)](
                    const char* filename, int line, const char* funcname,
                    Level lvl, const std::string& msg) {
                  logger->Log(filename, line, funcname, lvl, msg);
                  logger->Flush();
                },
                lvl};
}

Logger MakeNullLogger() noexcept { return Logger{}; }

Logger MakeStdoutLogger(Level lvl) {
  return MakeLogger(std::make_shared<StdoutLogger>(), lvl);
}

Logger MakeFileLogger(const std::string& log_path, Level lvl) {
  return MakeLogger(std::make_shared<FileLogger>(log_path), lvl);
}

Logger MakeCallbackLogger(LoggerCb logger_cb, Level lvl) noexcept {
  return Logger{std::move(logger_cb), lvl};
}

}  // namespace torctl::logger
