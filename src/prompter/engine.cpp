/*
VoicePrompter — Advancement engine: the single consumer of the command channel.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "engine.h"

#include "debug_log.h"

namespace vprompter {

Engine::Engine(Session& session, CommandChannel& channel, AdvancementPolicy& policy,
               Presenter& presenter, EngineOptions options)
    : session_(session),
      channel_(channel),
      policy_(policy),
      presenter_(presenter),
      options_(options) {}

void Engine::publishExpected() {
  session_.expected.publish(policy_.expectedUnit());
}

void Engine::render() {
  policy_.render(presenter_, session_.voiceActive());
}

bool Engine::dispatch(const Command& cmd) {
  ++applied_;
  DEBUG_LOG("engine: %s from %s", commandTypeName(cmd.type), commandSourceName(cmd.source));

  switch (cmd.type) {
    case CommandType::ToggleVoice:
      if (!session_.voiceAvailable()) {
        DEBUG_LOG("engine: voice toggle ignored, no microphone");
        return false;
      }
      DEBUG_LOG("engine: voice %s", session_.toggleVoice() ? "on" : "off");
      return true;

    case CommandType::Quit:
      policy_.apply(cmd);
      session_.stop.requestStop();
      return false;

    default:
      break;
  }

  switch (policy_.apply(cmd)) {
    case Effect::Moved:
      publishExpected();
      return true;
    case Effect::Redraw:
      return true;
    case Effect::None:
      break;
  }
  return false;
}

EngineResult Engine::run() {
  using Clock = std::chrono::steady_clock;

  const auto wait = policy_.continuous() ? options_.continuousWait : options_.discreteWait;

  publishExpected();
  render();

  auto last = Clock::now();
  while (!session_.stop.stopRequested() && !policy_.finished()) {
    bool redraw = false;
    if (auto cmd = channel_.popFor(wait)) {
      redraw = dispatch(*cmd);
    }

    const auto now = Clock::now();
    const std::chrono::duration<double> dt = now - last;
    last = now;

    if (policy_.continuous()) {
      policy_.tick(dt.count());
      redraw = true;
    }

    if (redraw && !policy_.finished()) {
      render();
    }
  }

  EngineResult result = EngineResult::Stopped;
  if (policy_.quit()) {
    result = EngineResult::Quit;
  } else if (policy_.finished()) {
    result = EngineResult::Completed;
  }

  session_.stop.requestStop();
  channel_.close();
  DEBUG_LOG("engine: finished (%s) after %zu commands", engineResultName(result), applied_);
  return result;
}

const char* engineResultName(EngineResult result) {
  switch (result) {
    case EngineResult::Completed: return "completed";
    case EngineResult::Quit: return "quit";
    case EngineResult::Stopped: return "stopped";
  }
  return "?";
}

}  // namespace vprompter
