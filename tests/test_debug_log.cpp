/*
VoicePrompter — Debug log tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "prompter/debug_log.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

namespace {

std::string readAll(const std::string& path) {
  std::ifstream f(path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

class DebugLogTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = std::string(::testing::TempDir()) + "vprompter_debug_test.log";
    std::remove(path_.c_str());
    DebugLog::SetPath(path_);
  }
  void TearDown() override {
    DebugLog::SetEnabled(false);
    DebugLog::SetPath("");
    std::remove(path_.c_str());
  }

  std::string path_;
};

}  // namespace

TEST_F(DebugLogTest, DisabledWritesNothing) {
  DebugLog::SetEnabled(false);
  DebugLog::Log("hidden %d", 1);
  EXPECT_EQ(readAll(path_), "");
}

TEST_F(DebugLogTest, WritesTimestampedLines) {
  DebugLog::SetEnabled(true);
  EXPECT_EQ(DebugLog::GetLogPath(), path_);
  DebugLog::Log("engine: %s after %d commands", "quit", 3);

  const std::string text = readAll(path_);
  ASSERT_FALSE(text.empty());
  EXPECT_EQ(text.front(), '[');
  EXPECT_NE(text.find("] engine: quit after 3 commands\n"), std::string::npos);

  DebugLog::ClearLog();
  EXPECT_EQ(readAll(path_), "");
}

TEST_F(DebugLogTest, DefaultPathIsInTempDir) {
  DebugLog::SetPath("");
  const std::string p = DebugLog::GetLogPath();
  EXPECT_NE(p.find("voicePrompter_debug.log"), std::string::npos);
}
