/*
VoicePrompter — Marquee-style continuous scrolling.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "continuous_policy.h"

#include "utf8.h"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace vprompter {

ContinuousPolicy::ContinuousPolicy(std::string text, int viewportWidth, double baseSpeed)
    : text_(std::move(text)),
      textLength_(codepointCount(text_)),
      viewportWidth_(std::max(1, viewportWidth)),
      baseSpeed_(baseSpeed > 0.0 ? baseSpeed : kDefaultBaseSpeed) {
  lastSpeed_ = baseSpeed_;
}

void ContinuousPolicy::tap(int direction, Command::Clock::time_point when) {
  const std::chrono::duration<double> sinceLast = when - lastTap_;

  if (direction != state_.direction) {
    // Reversing always restarts the ladder.
    state_.direction = direction;
    ladderStep_ = 0;
  } else if (lastTapDirection_ == direction && sinceLast.count() >= 0.0 &&
             sinceLast.count() < kTapWindowSeconds) {
    ladderStep_ = std::min(ladderStep_ + 1, kSpeedLadder.size() - 1);
  } else {
    ladderStep_ = 0;
  }

  state_.velocity = baseSpeed_ * kSpeedLadder[ladderStep_];
  lastSpeed_ = state_.velocity;
  lastTap_ = when;
  lastTapDirection_ = direction;
}

Effect ContinuousPolicy::apply(const Command& cmd) {
  if (exited_) return Effect::None;

  switch (cmd.type) {
    case CommandType::Quit:
      exited_ = true;
      return Effect::None;

    case CommandType::Next:
      // Speech while paused keeps the text moving.
      if (state_.velocity > 0.0) return Effect::None;
      state_.velocity = lastSpeed_;
      return Effect::Redraw;

    case CommandType::TogglePause:
      state_.velocity = state_.velocity > 0.0 ? 0.0 : lastSpeed_;
      return Effect::Redraw;

    case CommandType::SetSpeed:
      if (cmd.speedMode == SpeedMode::Delta) {
        if (cmd.speedValue == 0.0) return Effect::None;
        tap(cmd.speedValue > 0.0 ? 1 : -1, cmd.when);
      } else if (cmd.speedValue <= 0.0) {
        state_.velocity = 0.0;
      } else {
        state_.velocity = baseSpeed_ * cmd.speedValue;
        lastSpeed_ = state_.velocity;
        ladderStep_ = 0;
      }
      return Effect::Redraw;

    case CommandType::Previous:
    case CommandType::ToggleVoice:
      break;
  }
  return Effect::None;
}

bool ContinuousPolicy::clamp() {
  const double maxOff = maxOffset();
  const double before = state_.offset;

  bool atBound = false;
  if (state_.offset < 0.0 || (state_.offset == 0.0 && state_.direction < 0)) {
    state_.offset = 0.0;
    atBound = true;
  } else if (state_.offset > maxOff || (state_.offset == maxOff && state_.direction > 0)) {
    state_.offset = maxOff;
    atBound = true;
  }

  bool stopped = false;
  if (atBound && state_.velocity > 0.0) {
    state_.velocity = 0.0;
    stopped = true;
  }
  return stopped || state_.offset != before;
}

bool ContinuousPolicy::tick(double dtSeconds) {
  if (exited_) return false;

  bool changed = false;
  if (state_.velocity > 0.0 && dtSeconds > 0.0) {
    state_.offset += state_.velocity * state_.direction * dtSeconds;
    changed = true;
  }
  return clamp() || changed;
}

void ContinuousPolicy::setViewportWidth(int width) {
  viewportWidth_ = std::max(1, width);
  if (state_.offset > maxOffset()) {
    state_.offset = maxOffset();
    state_.velocity = 0.0;
  }
}

double ContinuousPolicy::maxOffset() const {
  return static_cast<double>(textLength_) + static_cast<double>(viewportWidth_);
}

double ContinuousPolicy::progress() const {
  const double maxOff = maxOffset();
  if (maxOff <= 0.0) return 0.0;
  return std::min(1.0, std::max(0.0, state_.offset / maxOff));
}

std::string ContinuousPolicy::speedIndicator() const {
  if (state_.velocity <= 0.0) return "PAUSED";

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%s %gx", state_.direction > 0 ? ">>" : "<<", multiplier());
  return buf;
}

void ContinuousPolicy::render(Presenter& out, bool voiceOn) {
  setViewportWidth(out.viewportWidth());
  out.showMarquee(text_, state_.offset, progress(), speedIndicator(), voiceOn);
}

}  // namespace vprompter
