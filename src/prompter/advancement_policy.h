/*
VoicePrompter — Advancement policy interface.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_ADVANCEMENT_POLICY_H
#define VPROMPTER_ADVANCEMENT_POLICY_H

#include "command.h"
#include "presenter.h"

#include <string>

namespace vprompter {

// What applying a command did to the policy's state.
enum class Effect {
  None,
  // Something visible changed (speed, pause state).
  Redraw,
  // The cursor moved to a different unit; the expected unit must be
  // republished to the voice source.
  Moved,
};

// Owns the cursor (or scroll) state and applies commands to it.
// Only the engine thread touches a policy.
class AdvancementPolicy {
public:
  virtual ~AdvancementPolicy() = default;

  // ToggleVoice never reaches a policy; the engine handles it.
  virtual Effect apply(const Command& cmd) = 0;

  // Time-driven update. Returns true if the state changed.
  virtual bool tick(double dtSeconds) = 0;

  // True when the policy wants tick() and a redraw on every loop iteration.
  virtual bool continuous() const = 0;

  // Done or quit: the engine stops consuming commands.
  virtual bool finished() const = 0;

  // True if the policy ended through Quit rather than by completing.
  virtual bool quit() const = 0;

  // Unit the speaker should be reading now; empty when there is none.
  virtual std::string expectedUnit() const = 0;

  virtual void render(Presenter& out, bool voiceOn) = 0;
};

}  // namespace vprompter

#endif  // VPROMPTER_ADVANCEMENT_POLICY_H
