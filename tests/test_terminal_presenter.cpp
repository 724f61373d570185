/*
VoicePrompter — Terminal rendering tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "console/terminal_presenter.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace vprompter;

TEST(TerminalPresenter, WrapWords) {
  const auto lines = TerminalPresenter::wrapWords("the quick brown fox jumps over", 10);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[0], "the quick");
  EXPECT_EQ(lines[1], "brown fox");
  EXPECT_EQ(lines[2], "jumps over");
}

TEST(TerminalPresenter, WrapKeepsLongWordWhole) {
  const auto lines = TerminalPresenter::wrapWords("a supercalifragilistic b", 5);
  ASSERT_EQ(lines.size(), 3u);
  EXPECT_EQ(lines[1], "supercalifragilistic");
}

TEST(TerminalPresenter, ProgressBar) {
  EXPECT_EQ(TerminalPresenter::progressBar(0.0, 6), "[....]");
  EXPECT_EQ(TerminalPresenter::progressBar(0.5, 6), "[##..]");
  EXPECT_EQ(TerminalPresenter::progressBar(2.0, 6), "[####]");
}

TEST(TerminalPresenter, HidesAndRestoresCursor) {
  std::ostringstream out;
  {
    TerminalPresenter p(out, -1);
    EXPECT_NE(out.str().find("\x1b[?25l"), std::string::npos);
  }
  EXPECT_NE(out.str().find("\x1b[?25h"), std::string::npos);
}

TEST(TerminalPresenter, ShowUnit) {
  std::ostringstream out;
  TerminalPresenter p(out, -1);
  p.setFixedSize(40, 12);
  p.showUnit("Hello there, friend.", 1, 5, true);

  const std::string s = out.str();
  EXPECT_NE(s.find("[2/5]"), std::string::npos);
  EXPECT_NE(s.find("Hello there, friend."), std::string::npos);
  EXPECT_NE(s.find("MIC ON"), std::string::npos);
}

TEST(TerminalPresenter, MarqueeWindow) {
  std::ostringstream out;
  TerminalPresenter p(out, -1);
  p.setFixedSize(11, 10);
  ASSERT_EQ(p.viewportWidth(), 10);

  // Offset 10: the text has fully entered from the right.
  p.showMarquee("abcdefghijKLMNOP", 10.0, 0.5, ">> 1x", false);
  const std::string s = out.str();
  EXPECT_NE(s.find("abcdefghij"), std::string::npos);
  EXPECT_EQ(s.find("K"), std::string::npos);
  EXPECT_NE(s.find(">> 1x"), std::string::npos);
  EXPECT_NE(s.find("MIC OFF"), std::string::npos);
}

TEST(TerminalPresenter, FallbackSizeWithoutTerminal) {
  std::ostringstream out;
  TerminalPresenter p(out, -1);
  EXPECT_EQ(p.size().cols, 80);
  EXPECT_EQ(p.size().rows, 24);
  EXPECT_EQ(p.viewportWidth(), 79);
}
