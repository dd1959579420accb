#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <filesystem>

#include "../../common/utilities_test.hpp"
#include "docu_core/errors.hpp"
#include "docu_core/logging.hpp"

namespace docu_core {

TEST(LoggingTest, ParseLogLevel_KnownNames) {
  EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
  EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
  EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
  EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
  EXPECT_EQ(parse_log_level("critical"), spdlog::level::critical);
  EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
}

TEST(LoggingTest, ParseLogLevel_UnknownNameThrows) {
  EXPECT_THROW(parse_log_level("verbose"), ConfigError);
  EXPECT_THROW(parse_log_level("INFO"), ConfigError);
}

TEST(LoggingTest, InitLogging_InstallsDefaultLoggerWithFileSink) {
  auto previous = spdlog::default_logger();
  auto dir = docu_tests::TestUtilities::create_temp_dir("logging_tests");

  LoggingSettings settings;
  settings.log_level = "warn";
  settings.log_file = (dir / "logs" / "documind.log").string();

  init_logging(settings);
  spdlog::warn("written to the rotating file");

  EXPECT_EQ(spdlog::default_logger()->name(), "documind");
  EXPECT_EQ(spdlog::default_logger()->level(), spdlog::level::warn);
  EXPECT_TRUE(std::filesystem::exists(settings.log_file));
  EXPECT_GT(std::filesystem::file_size(settings.log_file), 0u);

  spdlog::set_default_logger(previous);
  std::filesystem::remove_all(dir);
}

}  // namespace docu_core
