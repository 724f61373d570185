/*
VoicePrompter — Phrase-by-phrase advancement.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_DISCRETE_POLICY_H
#define VPROMPTER_DISCRETE_POLICY_H

#include "advancement_policy.h"

#include <cstddef>
#include <string>
#include <vector>

namespace vprompter {

enum class DiscreteState {
  Active,
  // Stepped past the last unit.
  Done,
  // Quit.
  Exited,
};

// Integer cursor over the script units.
//
//   Active(i)  --Next-->      Active(i+1), or Done after the last unit
//   Active(i)  --Previous-->  Active(i-1), or stays at 0
//   Active(i)  --Quit-->      Exited
//   Done, Exited              terminal; every command is a no-op
class DiscretePolicy : public AdvancementPolicy {
public:
  // Throws EmptyScriptError if units is empty.
  explicit DiscretePolicy(std::vector<std::string> units);

  Effect apply(const Command& cmd) override;
  bool tick(double dtSeconds) override;
  bool continuous() const override { return false; }
  bool finished() const override { return state_ != DiscreteState::Active; }
  bool quit() const override { return state_ == DiscreteState::Exited; }
  std::string expectedUnit() const override;
  void render(Presenter& out, bool voiceOn) override;

  DiscreteState state() const { return state_; }
  // Equals total() once Done.
  std::size_t index() const { return index_; }
  std::size_t total() const { return units_.size(); }

private:
  std::vector<std::string> units_;
  std::size_t index_ = 0;
  DiscreteState state_ = DiscreteState::Active;
};

}  // namespace vprompter

#endif  // VPROMPTER_DISCRETE_POLICY_H
