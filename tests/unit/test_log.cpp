/**
 * @file test_log.cpp
 * @brief Unit tests for logger setup
 */

#include <btcatalog/log.h>
#include <gtest/gtest.h>

#include <filesystem>
#include <unistd.h>

using namespace btcatalog;

TEST(LogTest, ParseLevels) {
  EXPECT_EQ(log::parse_level("debug"), spdlog::level::debug);
  EXPECT_EQ(log::parse_level(" WARNING "), spdlog::level::warn);
  EXPECT_EQ(log::parse_level("err"), spdlog::level::err);
  EXPECT_FALSE(log::parse_level("verbose").has_value());
}

TEST(LogTest, ValidateConfig) {
  log::LogConfig config;
  EXPECT_TRUE(config.validate().is_ok());

  config.level = "noisy";
  EXPECT_EQ(config.validate().error().code, ErrorCode::ConfigError);

  config.level = "info";
  config.file = "/tmp/btcatalog.log";
  config.max_files = 0;
  EXPECT_TRUE(config.validate().is_error());
}

TEST(LogTest, GetCreatesSharedLogger) {
  auto first = log::get();
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->name(), log::LOGGER_NAME);
  EXPECT_EQ(log::get(), first);
}

TEST(LogTest, InitReplacesLoggerAndSetsLevel) {
  auto dir = std::filesystem::temp_directory_path() /
             ("btcatalog_log_" + std::to_string(::getpid()));
  std::filesystem::create_directories(dir);

  log::LogConfig config;
  config.level = "debug";
  config.file = (dir / "btcatalog.log").string();
  ASSERT_TRUE(log::init(config).is_ok());

  log::get()->debug("written to file");
  log::get()->flush();
  EXPECT_EQ(log::get()->level(), spdlog::level::debug);
  EXPECT_TRUE(std::filesystem::exists(dir / "btcatalog.log"));

  ASSERT_TRUE(log::set_level("error").is_ok());
  EXPECT_EQ(log::get()->level(), spdlog::level::err);
  EXPECT_TRUE(log::set_level("bogus").is_error());

  ASSERT_TRUE(log::init(log::LogConfig{}).is_ok());
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

TEST(LogTest, UnwritableFileIsReported) {
  log::LogConfig config;
  config.file = "/proc/btcatalog/does/not/exist.log";
  auto result = log::init(config);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::FileWriteError);
}
