/*
VoicePrompter — Phrase-by-phrase advancement tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "prompter/discrete_policy.h"
#include "prompter/errors.h"
#include "prompter/segmenter.h"

#include "test_support.h"

#include <gtest/gtest.h>

using namespace vprompter;

namespace {

Command key(CommandType t) {
  return Command::make(t, CommandSource::Keyboard);
}

}  // namespace

TEST(DiscretePolicy, RejectsEmptyScript) {
  EXPECT_THROW(DiscretePolicy({}), EmptyScriptError);
}

TEST(DiscretePolicy, ThreeNextsReachDone) {
  DiscretePolicy p(segment("One. Two. Three.", SegmentMode::Sentence));
  ASSERT_EQ(p.total(), 3u);
  EXPECT_EQ(p.expectedUnit(), "One.");

  EXPECT_EQ(p.apply(key(CommandType::Next)), Effect::Moved);
  EXPECT_EQ(p.expectedUnit(), "Two.");
  EXPECT_EQ(p.apply(key(CommandType::Next)), Effect::Moved);
  EXPECT_EQ(p.index(), 2u);
  EXPECT_EQ(p.apply(key(CommandType::Next)), Effect::Moved);

  EXPECT_EQ(p.state(), DiscreteState::Done);
  EXPECT_TRUE(p.finished());
  EXPECT_FALSE(p.quit());
  EXPECT_EQ(p.index(), p.total());
  EXPECT_EQ(p.expectedUnit(), "");
}

TEST(DiscretePolicy, DoneIgnoresEverything) {
  DiscretePolicy p({"only"});
  p.apply(key(CommandType::Next));
  ASSERT_EQ(p.state(), DiscreteState::Done);

  EXPECT_EQ(p.apply(key(CommandType::Previous)), Effect::None);
  EXPECT_EQ(p.apply(key(CommandType::Next)), Effect::None);
  EXPECT_EQ(p.apply(key(CommandType::Quit)), Effect::None);
  EXPECT_EQ(p.state(), DiscreteState::Done);
}

TEST(DiscretePolicy, PreviousAtStartIsNoOp) {
  DiscretePolicy p({"a", "b"});
  EXPECT_EQ(p.apply(key(CommandType::Previous)), Effect::None);
  EXPECT_EQ(p.index(), 0u);
  EXPECT_EQ(p.state(), DiscreteState::Active);
}

TEST(DiscretePolicy, PreviousStepsBack) {
  DiscretePolicy p({"a", "b", "c"});
  p.apply(key(CommandType::Next));
  p.apply(key(CommandType::Next));
  EXPECT_EQ(p.apply(key(CommandType::Previous)), Effect::Moved);
  EXPECT_EQ(p.expectedUnit(), "b");
}

TEST(DiscretePolicy, QuitExitsAndFreezes) {
  DiscretePolicy p({"a", "b"});
  p.apply(key(CommandType::Quit));
  EXPECT_EQ(p.state(), DiscreteState::Exited);
  EXPECT_TRUE(p.finished());
  EXPECT_TRUE(p.quit());

  EXPECT_EQ(p.apply(key(CommandType::Next)), Effect::None);
  EXPECT_EQ(p.index(), 0u);
}

TEST(DiscretePolicy, IgnoresMarqueeCommands) {
  DiscretePolicy p({"a", "b"});
  EXPECT_EQ(p.apply(Command::speed(SpeedMode::Delta, 1, CommandSource::Keyboard)), Effect::None);
  EXPECT_EQ(p.apply(key(CommandType::TogglePause)), Effect::None);
  EXPECT_EQ(p.apply(key(CommandType::ToggleVoice)), Effect::None);
  EXPECT_FALSE(p.tick(1.0));
  EXPECT_EQ(p.index(), 0u);
}

TEST(DiscretePolicy, IndexStaysInRange) {
  DiscretePolicy p({"a", "b", "c", "d"});
  const CommandType seq[] = {
    CommandType::Previous, CommandType::Next, CommandType::Next, CommandType::Previous,
    CommandType::Previous, CommandType::Previous, CommandType::Next, CommandType::Next,
    CommandType::Next, CommandType::Previous, CommandType::Next,
  };
  for (CommandType t : seq) {
    p.apply(key(t));
    if (p.state() == DiscreteState::Active) {
      EXPECT_LT(p.index(), p.total());
    }
  }
}

TEST(DiscretePolicy, RendersCurrentUnit) {
  DiscretePolicy p({"first", "second"});
  test::RecordingPresenter out;
  p.render(out, true);
  p.apply(key(CommandType::Next));
  p.render(out, false);

  ASSERT_EQ(out.units.size(), 2u);
  EXPECT_EQ(out.units[0].unit, "first");
  EXPECT_EQ(out.units[0].index, 0u);
  EXPECT_EQ(out.units[0].total, 2u);
  EXPECT_TRUE(out.units[0].voiceOn);
  EXPECT_EQ(out.units[1].unit, "second");
  EXPECT_FALSE(out.units[1].voiceOn);

  p.apply(key(CommandType::Next));
  p.render(out, false);
  EXPECT_EQ(out.units.size(), 2u);
}
