/*
VoicePrompter — Key decoding tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "prompter/key_decoder.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace vprompter;

namespace {

std::vector<Command> feedAll(KeyDecoder& d, const std::string& bytes) {
  std::vector<Command> out;
  for (unsigned char c : bytes) {
    if (auto cmd = d.feed(c)) out.push_back(*cmd);
  }
  return out;
}

}  // namespace

TEST(KeyDecoder, DiscreteMap) {
  KeyDecoder d(KeyMap::Discrete);
  const auto cmds = feedAll(d, " \nnNbBvqQx");
  ASSERT_EQ(cmds.size(), 9u);
  EXPECT_EQ(cmds[0].type, CommandType::Next);
  EXPECT_EQ(cmds[1].type, CommandType::Next);
  EXPECT_EQ(cmds[2].type, CommandType::Next);
  EXPECT_EQ(cmds[3].type, CommandType::Next);
  EXPECT_EQ(cmds[4].type, CommandType::Previous);
  EXPECT_EQ(cmds[5].type, CommandType::Previous);
  EXPECT_EQ(cmds[6].type, CommandType::ToggleVoice);
  EXPECT_EQ(cmds[7].type, CommandType::Quit);
  EXPECT_EQ(cmds[8].type, CommandType::Quit);
  for (const auto& c : cmds) EXPECT_EQ(c.source, CommandSource::Keyboard);
}

TEST(KeyDecoder, DigitsDoNothingInDiscreteMode) {
  KeyDecoder d(KeyMap::Discrete);
  EXPECT_TRUE(feedAll(d, "012").empty());
}

TEST(KeyDecoder, ArrowKeys) {
  KeyDecoder d(KeyMap::Discrete);
  const auto cmds = feedAll(d, "\x1b[C\x1b[D\x1bOC");
  ASSERT_EQ(cmds.size(), 3u);
  EXPECT_EQ(cmds[0].type, CommandType::Next);
  EXPECT_EQ(cmds[1].type, CommandType::Previous);
  EXPECT_EQ(cmds[2].type, CommandType::Next);
  EXPECT_FALSE(d.pending());
}

TEST(KeyDecoder, OtherEscapeSequencesAreSwallowed) {
  KeyDecoder d(KeyMap::Discrete);
  // Up arrow, F5, then a real key.
  const auto cmds = feedAll(d, "\x1b[A\x1b[15~n");
  ASSERT_EQ(cmds.size(), 1u);
  EXPECT_EQ(cmds[0].type, CommandType::Next);
}

TEST(KeyDecoder, LoneEscapeIsDroppedOnTimeout) {
  KeyDecoder d(KeyMap::Discrete);
  EXPECT_FALSE(d.feed(0x1b).has_value());
  EXPECT_TRUE(d.pending());
  d.timeout();
  EXPECT_FALSE(d.pending());
  // "[C" on its own is not an arrow.
  EXPECT_TRUE(feedAll(d, "[C").empty());
}

TEST(KeyDecoder, EscapeFollowedByKeyStillDecodesKey) {
  KeyDecoder d(KeyMap::Discrete);
  const auto cmds = feedAll(d, "\x1bq");
  ASSERT_EQ(cmds.size(), 1u);
  EXPECT_EQ(cmds[0].type, CommandType::Quit);
}

TEST(KeyDecoder, CtrlCQuits) {
  KeyDecoder d(KeyMap::Continuous);
  auto cmd = d.feed(0x03);
  ASSERT_TRUE(cmd.has_value());
  EXPECT_EQ(cmd->type, CommandType::Quit);
}

TEST(KeyDecoder, ContinuousMap) {
  KeyDecoder d(KeyMap::Continuous);
  const auto cmds = feedAll(d, " \x1b[C\x1b[Db012v");
  ASSERT_EQ(cmds.size(), 8u);

  EXPECT_EQ(cmds[0].type, CommandType::TogglePause);

  EXPECT_EQ(cmds[1].type, CommandType::SetSpeed);
  EXPECT_EQ(cmds[1].speedMode, SpeedMode::Delta);
  EXPECT_GT(cmds[1].speedValue, 0.0);

  EXPECT_EQ(cmds[2].speedMode, SpeedMode::Delta);
  EXPECT_LT(cmds[2].speedValue, 0.0);
  EXPECT_LT(cmds[3].speedValue, 0.0);

  EXPECT_EQ(cmds[4].speedMode, SpeedMode::Absolute);
  EXPECT_DOUBLE_EQ(cmds[4].speedValue, 0.0);
  EXPECT_DOUBLE_EQ(cmds[5].speedValue, 1.0);
  EXPECT_DOUBLE_EQ(cmds[6].speedValue, 2.0);

  EXPECT_EQ(cmds[7].type, CommandType::ToggleVoice);
}

TEST(KeyDecoder, KeepsTimestamp) {
  KeyDecoder d(KeyMap::Continuous);
  const auto when = Command::Clock::time_point(std::chrono::seconds(42));
  auto cmd = d.feed('n', when);
  ASSERT_TRUE(cmd.has_value());
  EXPECT_EQ(cmd->when, when);
}
