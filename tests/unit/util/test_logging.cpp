#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "idkit/util/logging.hpp"
#include "test_helpers.hpp"

using namespace idkit;
using namespace idkit::util;
using namespace idkit::test;

class LoggingTest : public TempDirTest {
 protected:
  void TearDown() override {
    // Release the file sink before the directory is removed
    Logging::initialize(LogOptions{});
    TempDirTest::TearDown();
  }
};

TEST_F(LoggingTest, ParseLevelNames) {
  auto level = Logging::parseLevel("debug");
  ASSERT_OK(level);
  EXPECT_EQ(*level, spdlog::level::debug);
  EXPECT_EQ(*Logging::parseLevel("warning"), spdlog::level::warn);
  EXPECT_EQ(*Logging::parseLevel("off"), spdlog::level::off);

  EXPECT_ERROR(Logging::parseLevel("DEBUG"), ErrorCode::kValidationError);
  EXPECT_ERROR(Logging::parseLevel(""), ErrorCode::kValidationError);
}

TEST_F(LoggingTest, VerbosityOnlyLowersThreshold) {
  EXPECT_EQ(Logging::verbosityLevel(0, spdlog::level::warn), spdlog::level::warn);
  EXPECT_EQ(Logging::verbosityLevel(1, spdlog::level::warn), spdlog::level::info);
  EXPECT_EQ(Logging::verbosityLevel(2, spdlog::level::warn), spdlog::level::debug);
  EXPECT_EQ(Logging::verbosityLevel(5, spdlog::level::warn), spdlog::level::trace);

  // A config that already asks for trace keeps it
  EXPECT_EQ(Logging::verbosityLevel(1, spdlog::level::trace), spdlog::level::trace);
}

TEST_F(LoggingTest, InitializeInstallsDefaultLogger) {
  LogOptions options;
  options.level = spdlog::level::info;
  Logging::initialize(options);

  auto logger = spdlog::default_logger();
  EXPECT_EQ(logger->name(), "idkit");
  EXPECT_EQ(logger->level(), spdlog::level::info);
  EXPECT_EQ(logger->sinks().size(), 1u);
}

TEST_F(LoggingTest, UnusableLogFileFallsBackToConsole) {
  auto blocker = writeFile("blocker", "not a directory");

  LogOptions options;
  options.log_file = blocker / "idkit.log";
  Logging::initialize(options);

  EXPECT_EQ(spdlog::default_logger()->name(), "idkit");
  EXPECT_EQ(spdlog::default_logger()->sinks().size(), 1u);
}

TEST_F(LoggingTest, InitializeWithFileSink) {
  LogOptions options;
  options.level = spdlog::level::debug;
  options.log_file = temp_dir_ / "logs" / "idkit.log";
  Logging::initialize(options);

  spdlog::debug("file sink check");
  spdlog::default_logger()->flush();

  EXPECT_EQ(spdlog::default_logger()->sinks().size(), 2u);
  EXPECT_TRUE(std::filesystem::exists(options.log_file));
  EXPECT_GT(std::filesystem::file_size(options.log_file), 0u);
}
