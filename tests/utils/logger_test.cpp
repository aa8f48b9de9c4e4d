#include <gtest/gtest.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utils/logger.hpp>
#include <test_utils/capture_logger.hpp>

namespace torctl::logger {

TEST(LoggerTest, NullLoggerDropsEverything) {
  const auto logger = MakeNullLogger();
  EXPECT_FALSE(logger.ShouldLog(critical));
  TORCTL_LOG(logger, critical, "dropped {}", 1);
}

TEST(LoggerTest, CallbackReceivesFormattedMessage) {
  auto records = std::make_shared<test::LogRecords>();
  const auto logger = test::MakeCaptureLogger(records, info);
  TORCTL_LOG(logger, info, "cookie at {} is {} bytes", "/tmp/x", 32);
  ASSERT_EQ(records->size(), 1u);
  EXPECT_EQ(records->front().lvl, info);
  EXPECT_EQ(records->front().msg, "cookie at /tmp/x is 32 bytes");
}

TEST(LoggerTest, LevelFilters) {
  auto records = std::make_shared<test::LogRecords>();
  auto logger = test::MakeCaptureLogger(records, warn);
  TORCTL_LOG(logger, debug, "hidden");
  TORCTL_LOG(logger, info, "hidden");
  TORCTL_LOG(logger, warn, "shown");
  TORCTL_LOG(logger, error, "shown");
  EXPECT_EQ(records->size(), 2u);
  logger.SetLevel(off);
  TORCTL_LOG(logger, critical, "hidden");
  EXPECT_EQ(records->size(), 2u);
  EXPECT_EQ(logger.GetLevel(), off);
}

TEST(LoggerTest, PlainStringMessage) {
  auto records = std::make_shared<test::LogRecords>();
  const auto logger = test::MakeCaptureLogger(records);
  const std::string msg{"braces {} are kept"};
  TORCTL_LOG(logger, debug, msg);
  ASSERT_EQ(records->size(), 1u);
  EXPECT_EQ(records->front().msg, "braces {} are kept");
}

TEST(LoggerTest, ThrowingCallbackIsContained) {
  const auto logger = MakeCallbackLogger(
      [](const char*, int, const char*, Level, const std::string&) {
        throw std::runtime_error{"sink failure"};
      },
      trace);
  EXPECT_NO_THROW(TORCTL_LOG(logger, info, "message"));
}

TEST(LoggerTest, FileLogger) {
  const auto path = (std::filesystem::temp_directory_path() /
                     ("torctl_logger_" + std::to_string(getpid()) + ".log"))
                        .string();
  std::filesystem::remove(path);
  {
    const auto logger = MakeFileLogger(path, info);
    TORCTL_LOG(logger, info, "written to file");
    TORCTL_LOG(logger, debug, "not written");
  }
  std::ifstream file{path};
  std::stringstream contents;
  contents << file.rdbuf();
  EXPECT_NE(contents.str().find("written to file"), std::string::npos);
  EXPECT_EQ(contents.str().find("not written"), std::string::npos);
  std::filesystem::remove(path);
}

}  // namespace torctl::logger
