/*
VoicePrompter — Advancement engine: the single consumer of the command channel.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_ENGINE_H
#define VPROMPTER_ENGINE_H

#include "advancement_policy.h"
#include "command_channel.h"
#include "presenter.h"
#include "session.h"

#include <chrono>
#include <cstddef>

namespace vprompter {

enum class EngineResult {
  // Discrete policy stepped past the last unit.
  Completed,
  // A Quit command was consumed.
  Quit,
  // The stop token was set from elsewhere (fatal worker error).
  Stopped,
};

struct EngineOptions {
  // Bounded wait on the channel between periodic work. The continuous
  // policy uses this as its tick cadence.
  std::chrono::milliseconds discreteWait{30};
  std::chrono::milliseconds continuousWait{16};
};

class Engine {
public:
  Engine(Session& session, CommandChannel& channel, AdvancementPolicy& policy,
         Presenter& presenter, EngineOptions options = {});

  // Runs the consume/tick loop on the calling thread until the policy is
  // finished or the session is stopped. On return the stop token is set and
  // the channel is closed, so every source winds down.
  EngineResult run();

  std::size_t commandsApplied() const { return applied_; }

private:
  // Returns true if a redraw is needed.
  bool dispatch(const Command& cmd);
  void publishExpected();
  void render();

  Session& session_;
  CommandChannel& channel_;
  AdvancementPolicy& policy_;
  Presenter& presenter_;
  EngineOptions options_;
  std::size_t applied_ = 0;
};

const char* engineResultName(EngineResult result);

}  // namespace vprompter

#endif  // VPROMPTER_ENGINE_H
