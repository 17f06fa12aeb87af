/**
 * @file test_logger_engine.cpp
 * @brief Unit test for LogLib::LoggerEngine
 */

#include <gtest/gtest.h>

#include "LoggerEngine.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace LogLib;
namespace fs = std::filesystem;

class LoggerEngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    base_ = fs::path(::testing::TempDir()) /
            ("loglib_" + std::to_string(::getpid()));
    fs::remove_all(base_);

    auto &engine = LoggerEngine::getInstance();
    engine.setConsoleOutput(false);
    engine.setFileOutput(true);
    engine.setLogBasePath(base_.string());
    engine.setLogLevel(LogLevel::DEBUG);
    engine.resetStatistics();
  }

  void TearDown() override {
    auto &engine = LoggerEngine::getInstance();
    engine.flushAll();
    engine.setConsoleOutput(true);
    fs::remove_all(base_);
  }

  std::vector<fs::path> logFiles() const {
    std::vector<fs::path> files;
    std::error_code ec;
    for (const auto &entry : fs::recursive_directory_iterator(base_, ec)) {
      if (entry.is_regular_file()) {
        files.push_back(entry.path());
      }
    }
    return files;
  }

  static std::string readAll(const fs::path &path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
  }

  fs::path base_;
};

TEST_F(LoggerEngineTest, LevelNamesParseCaseInsensitively) {
  EXPECT_EQ(LogLevelFromString("trace"), LogLevel::TRACE);
  EXPECT_EQ(LogLevelFromString("Debug"), LogLevel::DEBUG);
  EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::WARN);
  EXPECT_EQ(LogLevelFromString("error"), LogLevel::LOG_ERROR);
  EXPECT_EQ(LogLevelFromString("critical"), LogLevel::LOG_FATAL);
  EXPECT_EQ(LogLevelFromString("off"), LogLevel::OFF);
  EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::INFO);
  EXPECT_EQ(LogLevelToString(LogLevel::LOG_ERROR), "ERROR");
}

TEST_F(LoggerEngineTest, RecordsBelowMinimumLevelAreDropped) {
  auto &engine = LoggerEngine::getInstance();
  engine.setLogLevel(LogLevel::WARN);

  engine.log("bridge", LogLevel::INFO, "hidden");
  engine.log("bridge", LogLevel::WARN, "shown");
  engine.log("bridge", LogLevel::LOG_ERROR, "shown too");

  LogStatistics stats = engine.getStatistics();
  EXPECT_EQ(stats.total_logs, 2u);
  EXPECT_EQ(stats.info_count, 0u);
  EXPECT_EQ(stats.warn_count, 1u);
  EXPECT_EQ(stats.error_count, 1u);
}

TEST_F(LoggerEngineTest, CategoryGetsItsOwnFile) {
  auto &engine = LoggerEngine::getInstance();
  engine.log("health", LogLevel::INFO, "event=health queue_depth=3");
  engine.log("", LogLevel::INFO, "uncategorized");
  engine.flushAll();

  bool saw_health = false;
  bool saw_default = false;
  for (const auto &file : logFiles()) {
    const std::string content = readAll(file);
    if (file.filename() == "health.log") {
      saw_health = true;
      EXPECT_NE(content.find("[INFO][health] event=health queue_depth=3"),
                std::string::npos);
    } else if (file.filename() == "bridge.log") {
      saw_default = true;
      EXPECT_NE(content.find("uncategorized"), std::string::npos);
    }
  }
  EXPECT_TRUE(saw_health);
  EXPECT_TRUE(saw_default);
}

TEST_F(LoggerEngineTest, FileOutputCanBeDisabled) {
  auto &engine = LoggerEngine::getInstance();
  engine.setFileOutput(false);
  engine.log("health", LogLevel::INFO, "nowhere");
  engine.flushAll();
  EXPECT_TRUE(logFiles().empty());
  EXPECT_EQ(engine.getStatistics().total_logs, 1u);
}

TEST_F(LoggerEngineTest, FullFileRotatesToNumberedBackups) {
  auto &engine = LoggerEngine::getInstance();
  engine.setMaxLogSizeMB(1);
  engine.setMaxLogFiles(2);

  // three rotations worth of records, only two backups kept
  const std::string line(1024, 'x');
  for (int i = 0; i < 3 * 1100; ++i) {
    engine.log("rotation", LogLevel::INFO, line);
  }
  engine.flushAll();
  engine.setMaxLogSizeMB(100);
  engine.setMaxLogFiles(30);

  std::vector<std::string> names;
  for (const auto &file : logFiles()) {
    names.push_back(file.filename().string());
  }
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"rotation.log", "rotation.log.1",
                                             "rotation.log.2"}));
}

TEST_F(LoggerEngineTest, BasePathGetsTrailingSlash) {
  auto &engine = LoggerEngine::getInstance();
  engine.setLogBasePath("/tmp/nemo_logs");
  EXPECT_EQ(engine.getLogBasePath(), "/tmp/nemo_logs/");
  engine.setLogBasePath(base_.string());
}
