/*
VoicePrompter — Marquee-style continuous scrolling.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_CONTINUOUS_POLICY_H
#define VPROMPTER_CONTINUOUS_POLICY_H

#include "advancement_policy.h"

#include <array>
#include <cstddef>
#include <string>

namespace vprompter {

constexpr double kDefaultBaseSpeed = 15.0;  // code points per second
constexpr double kTapWindowSeconds = 0.3;
constexpr std::array<double, 3> kSpeedLadder = {1.0, 1.5, 2.0};

struct ScrollState {
  double offset = 0.0;    // code points, 0..maxOffset
  double velocity = 0.0;  // code points per second, >= 0
  int direction = 1;      // +1 forward, -1 backward
};

// Real-valued offset scrolled through a viewport at a chosen speed.
//
// offset stays inside [0, textLength + viewportWidth]. Running into either
// end clamps the offset and stops the scroll. Reaching the end never
// finishes the session; only Quit does.
class ContinuousPolicy : public AdvancementPolicy {
public:
  ContinuousPolicy(std::string text, int viewportWidth, double baseSpeed = kDefaultBaseSpeed);

  Effect apply(const Command& cmd) override;
  bool tick(double dtSeconds) override;
  bool continuous() const override { return true; }
  bool finished() const override { return exited_; }
  bool quit() const override { return exited_; }
  std::string expectedUnit() const override { return {}; }
  void render(Presenter& out, bool voiceOn) override;

  // Picks up terminal resizes; re-clamps the offset.
  void setViewportWidth(int width);

  const ScrollState& state() const { return state_; }
  double maxOffset() const;
  double progress() const;
  std::size_t textLength() const { return textLength_; }
  double multiplier() const { return state_.velocity / baseSpeed_; }

  // "PAUSED", ">> 1x", "<< 1.5x", ...
  std::string speedIndicator() const;

private:
  void tap(int direction, Command::Clock::time_point when);
  // Returns true if the offset hit a bound.
  bool clamp();

  std::string text_;
  std::size_t textLength_ = 0;
  int viewportWidth_ = 0;
  double baseSpeed_ = kDefaultBaseSpeed;

  ScrollState state_;
  double lastSpeed_ = 0.0;

  std::size_t ladderStep_ = 0;
  int lastTapDirection_ = 0;
  Command::Clock::time_point lastTap_{};

  bool exited_ = false;
};

}  // namespace vprompter

#endif  // VPROMPTER_CONTINUOUS_POLICY_H
