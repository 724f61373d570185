/*
VoicePrompter — Phrase-by-phrase advancement.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "discrete_policy.h"

#include "errors.h"

#include <utility>

namespace vprompter {

DiscretePolicy::DiscretePolicy(std::vector<std::string> units)
    : units_(std::move(units)) {
  if (units_.empty()) {
    throw EmptyScriptError("Script contains no units");
  }
}

Effect DiscretePolicy::apply(const Command& cmd) {
  if (state_ != DiscreteState::Active) return Effect::None;

  switch (cmd.type) {
    case CommandType::Next:
      ++index_;
      if (index_ >= units_.size()) {
        index_ = units_.size();
        state_ = DiscreteState::Done;
      }
      return Effect::Moved;

    case CommandType::Previous:
      if (index_ == 0) return Effect::None;
      --index_;
      return Effect::Moved;

    case CommandType::Quit:
      state_ = DiscreteState::Exited;
      return Effect::None;

    case CommandType::ToggleVoice:
    case CommandType::SetSpeed:
    case CommandType::TogglePause:
      break;
  }
  return Effect::None;
}

bool DiscretePolicy::tick(double) {
  return false;
}

std::string DiscretePolicy::expectedUnit() const {
  if (state_ != DiscreteState::Active) return {};
  return units_[index_];
}

void DiscretePolicy::render(Presenter& out, bool voiceOn) {
  if (state_ != DiscreteState::Active) return;
  out.showUnit(units_[index_], index_, units_.size(), voiceOn);
}

}  // namespace vprompter
