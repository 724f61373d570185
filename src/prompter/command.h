/*
VoicePrompter — Advancement commands produced by the input sources.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_COMMAND_H
#define VPROMPTER_COMMAND_H

#include <chrono>

namespace vprompter {

enum class CommandType {
  Next,
  Previous,
  Quit,
  ToggleVoice,
  SetSpeed,
  // Continuous policy only: stop/resume the scroll.
  TogglePause,
};

enum class CommandSource {
  Keyboard,
  Voice,
  // Signals and the tool itself.
  System,
};

enum class SpeedMode {
  // speedValue is a tap direction: > 0 forward, < 0 backward.
  Delta,
  // speedValue is a speed multiplier (0 pauses).
  Absolute,
};

struct Command {
  using Clock = std::chrono::steady_clock;

  CommandType type = CommandType::Next;
  CommandSource source = CommandSource::System;
  SpeedMode speedMode = SpeedMode::Delta;
  double speedValue = 0.0;
  Clock::time_point when{};

  static Command make(CommandType type, CommandSource source,
                      Clock::time_point when = Clock::now()) {
    Command c;
    c.type = type;
    c.source = source;
    c.when = when;
    return c;
  }

  static Command speed(SpeedMode mode, double value, CommandSource source,
                       Clock::time_point when = Clock::now()) {
    Command c = make(CommandType::SetSpeed, source, when);
    c.speedMode = mode;
    c.speedValue = value;
    return c;
  }
};

const char* commandTypeName(CommandType type);
const char* commandSourceName(CommandSource source);

}  // namespace vprompter

#endif  // VPROMPTER_COMMAND_H
