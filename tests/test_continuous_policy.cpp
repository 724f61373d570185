/*
VoicePrompter — Marquee scrolling tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "prompter/continuous_policy.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <chrono>

using namespace vprompter;
using namespace std::chrono_literals;

namespace {

const Command::Clock::time_point kT0 = Command::Clock::time_point(std::chrono::seconds(100));

Command tap(int dir, Command::Clock::time_point when) {
  return Command::speed(SpeedMode::Delta, dir, CommandSource::Keyboard, when);
}

Command key(CommandType t) {
  return Command::make(t, CommandSource::Keyboard, kT0);
}

// 10 code points of text through a 10 column viewport at 10 cps.
ContinuousPolicy makePolicy() {
  return ContinuousPolicy("0123456789", 10, 10.0);
}

}  // namespace

TEST(ContinuousPolicy, StartsPausedAtZero) {
  auto p = makePolicy();
  EXPECT_DOUBLE_EQ(p.state().offset, 0.0);
  EXPECT_DOUBLE_EQ(p.state().velocity, 0.0);
  EXPECT_EQ(p.speedIndicator(), "PAUSED");
  EXPECT_DOUBLE_EQ(p.maxOffset(), 20.0);
  EXPECT_TRUE(p.continuous());
  EXPECT_EQ(p.expectedUnit(), "");
}

TEST(ContinuousPolicy, TogglePauseResumesAtBaseSpeed) {
  auto p = makePolicy();
  EXPECT_EQ(p.apply(key(CommandType::TogglePause)), Effect::Redraw);
  EXPECT_DOUBLE_EQ(p.state().velocity, 10.0);
  EXPECT_EQ(p.speedIndicator(), ">> 1x");

  EXPECT_TRUE(p.tick(0.5));
  EXPECT_DOUBLE_EQ(p.state().offset, 5.0);
  EXPECT_DOUBLE_EQ(p.progress(), 0.25);

  p.apply(key(CommandType::TogglePause));
  EXPECT_DOUBLE_EQ(p.state().velocity, 0.0);
  p.tick(1.0);
  EXPECT_DOUBLE_EQ(p.state().offset, 5.0);
}

TEST(ContinuousPolicy, TapLadderWithinWindow) {
  auto p = makePolicy();
  p.apply(tap(+1, kT0));
  EXPECT_DOUBLE_EQ(p.multiplier(), 1.0);
  p.apply(tap(+1, kT0 + 100ms));
  EXPECT_DOUBLE_EQ(p.multiplier(), 1.5);
  EXPECT_EQ(p.speedIndicator(), ">> 1.5x");
  p.apply(tap(+1, kT0 + 200ms));
  EXPECT_DOUBLE_EQ(p.multiplier(), 2.0);
  p.apply(tap(+1, kT0 + 300ms));
  EXPECT_DOUBLE_EQ(p.multiplier(), 2.0);
}

TEST(ContinuousPolicy, SlowTapRestartsLadder) {
  auto p = makePolicy();
  p.apply(tap(+1, kT0));
  p.apply(tap(+1, kT0 + 100ms));
  ASSERT_DOUBLE_EQ(p.multiplier(), 1.5);
  p.apply(tap(+1, kT0 + 1s));
  EXPECT_DOUBLE_EQ(p.multiplier(), 1.0);
}

TEST(ContinuousPolicy, OppositeTapReversesAndResets) {
  auto p = makePolicy();
  p.apply(tap(+1, kT0));
  p.apply(tap(+1, kT0 + 100ms));
  p.tick(1.0);
  ASSERT_DOUBLE_EQ(p.state().offset, 15.0);

  p.apply(tap(-1, kT0 + 150ms));
  EXPECT_EQ(p.state().direction, -1);
  EXPECT_DOUBLE_EQ(p.multiplier(), 1.0);
  EXPECT_EQ(p.speedIndicator(), "<< 1x");

  p.tick(0.5);
  EXPECT_DOUBLE_EQ(p.state().offset, 10.0);
}

TEST(ContinuousPolicy, AbsoluteSpeed) {
  auto p = makePolicy();
  p.apply(Command::speed(SpeedMode::Absolute, 2.0, CommandSource::Keyboard, kT0));
  EXPECT_DOUBLE_EQ(p.state().velocity, 20.0);
  p.apply(Command::speed(SpeedMode::Absolute, 0.0, CommandSource::Keyboard, kT0));
  EXPECT_DOUBLE_EQ(p.state().velocity, 0.0);

  // Resume returns to the last non-zero speed.
  p.apply(key(CommandType::TogglePause));
  EXPECT_DOUBLE_EQ(p.state().velocity, 20.0);
}

TEST(ContinuousPolicy, NextResumesOnlyWhenPaused) {
  auto p = makePolicy();
  EXPECT_EQ(p.apply(Command::make(CommandType::Next, CommandSource::Voice, kT0)), Effect::Redraw);
  EXPECT_DOUBLE_EQ(p.state().velocity, 10.0);
  EXPECT_EQ(p.apply(Command::make(CommandType::Next, CommandSource::Voice, kT0)), Effect::None);
  EXPECT_DOUBLE_EQ(p.state().velocity, 10.0);
}

TEST(ContinuousPolicy, EndClampsAndStops) {
  auto p = makePolicy();
  p.apply(tap(+1, kT0));
  p.tick(5.0);
  EXPECT_DOUBLE_EQ(p.state().offset, p.maxOffset());
  EXPECT_DOUBLE_EQ(p.state().velocity, 0.0);
  EXPECT_DOUBLE_EQ(p.progress(), 1.0);
  EXPECT_FALSE(p.finished());
}

TEST(ContinuousPolicy, StartClampsAndStops) {
  auto p = makePolicy();
  p.apply(tap(+1, kT0));
  p.tick(0.3);
  p.apply(tap(-1, kT0 + 50ms));
  p.tick(2.0);
  EXPECT_DOUBLE_EQ(p.state().offset, 0.0);
  EXPECT_DOUBLE_EQ(p.state().velocity, 0.0);
}

TEST(ContinuousPolicy, OffsetAlwaysWithinBounds) {
  auto p = makePolicy();
  auto when = kT0;
  const int dirs[] = {+1, +1, -1, +1, -1, -1, +1, +1, +1};
  for (int d : dirs) {
    when += 120ms;
    p.apply(tap(d, when));
    for (int i = 0; i < 20; ++i) {
      p.tick(0.137);
      ASSERT_GE(p.state().offset, 0.0);
      ASSERT_LE(p.state().offset, p.maxOffset());
      ASSERT_GE(p.state().velocity, 0.0);
    }
  }
}

TEST(ContinuousPolicy, QuitFinishes) {
  auto p = makePolicy();
  p.apply(key(CommandType::Quit));
  EXPECT_TRUE(p.finished());
  EXPECT_TRUE(p.quit());
  EXPECT_EQ(p.apply(key(CommandType::TogglePause)), Effect::None);
  EXPECT_FALSE(p.tick(1.0));
}

TEST(ContinuousPolicy, IgnoresPreviousAndVoiceToggle) {
  auto p = makePolicy();
  EXPECT_EQ(p.apply(key(CommandType::Previous)), Effect::None);
  EXPECT_EQ(p.apply(key(CommandType::ToggleVoice)), Effect::None);
}

TEST(ContinuousPolicy, RenderFollowsViewportWidth) {
  auto p = makePolicy();
  p.apply(tap(+1, kT0));
  p.tick(1.8);
  ASSERT_DOUBLE_EQ(p.state().offset, 18.0);

  test::RecordingPresenter out;
  out.width = 4;
  p.render(out, false);
  EXPECT_DOUBLE_EQ(p.maxOffset(), 14.0);
  EXPECT_DOUBLE_EQ(p.state().offset, 14.0);
  EXPECT_DOUBLE_EQ(p.state().velocity, 0.0);

  ASSERT_EQ(out.marquee.size(), 1u);
  EXPECT_DOUBLE_EQ(out.marquee[0].offset, 14.0);
  EXPECT_DOUBLE_EQ(out.marquee[0].progress, 1.0);
  EXPECT_EQ(out.marquee[0].indicator, "PAUSED");
}
