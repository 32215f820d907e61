#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "logger.h"

using namespace GuardianLogger;

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

int evaluations = 0;

std::string CountedMessage() {
  evaluations++;
  return "counted";
}

}  // namespace

TEST(LoggerTest, ParseLevel) {
  Level level = ERROR;
  EXPECT_TRUE(ParseLevel("debug", &level));
  EXPECT_EQ(level, DEBUG);
  EXPECT_TRUE(ParseLevel("warning", &level));
  EXPECT_EQ(level, WARN);
  EXPECT_TRUE(ParseLevel("error", &level));
  EXPECT_EQ(level, ERROR);
  EXPECT_FALSE(ParseLevel("INFO", &level));
  EXPECT_FALSE(ParseLevel("", &level));
  EXPECT_EQ(level, ERROR);
}

TEST(LoggerTest, LevelGatesMessages) {
  Logger::SetLevel(WARN);
  EXPECT_FALSE(Logger::IsEnabled(INFO));
  EXPECT_TRUE(Logger::IsEnabled(WARN));
  EXPECT_TRUE(Logger::IsEnabled(ERROR));

  evaluations = 0;
  LOG_INFO("LoggerTest", CountedMessage());
  EXPECT_EQ(evaluations, 0);
  LOG_WARN("LoggerTest", CountedMessage());
  EXPECT_EQ(evaluations, 1);

  Logger::SetLevel(INFO);
}

TEST(LoggerTest, AttachedFileReceivesLines) {
  std::string path = "guardian_logger_test_" + std::to_string(getpid()) + ".log";
  std::remove(path.c_str());

  ASSERT_TRUE(Logger::AttachFile(path));
  Logger::SetLevel(INFO);
  LOG_INFO("Detector", "Initialized mode=balanced");
  LOG_ERROR("Config", "bad threshold");

  std::string contents = ReadFile(path);
  EXPECT_NE(contents.find("[INFO ] [Detector] Initialized mode=balanced\n"), std::string::npos);
  EXPECT_NE(contents.find("[ERROR] [Config] bad threshold\n"), std::string::npos);

  EXPECT_FALSE(Logger::AttachFile("/nonexistent-dir/guardian.log"));
  LOG_INFO("Detector", "stderr only");
  EXPECT_EQ(ReadFile(path).find("stderr only"), std::string::npos);

  std::remove(path.c_str());
}
