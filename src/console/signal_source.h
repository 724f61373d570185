/*
VoicePrompter — SIGINT/SIGTERM as Quit commands.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_SIGNAL_SOURCE_H
#define VPROMPTER_SIGNAL_SOURCE_H

#include "prompter/command_channel.h"
#include "prompter/session.h"

#include <chrono>

namespace vprompter {

// Waits for SIGINT or SIGTERM on a dedicated thread and turns the first one
// into a Quit command, so shutdown takes the same path as pressing 'q'.
//
// blockTerminationSignals() must run on the main thread before any other
// thread starts; every thread inherits the mask and only this source ever
// receives the signals.
class SignalSource {
public:
  SignalSource(Session& session, CommandChannel& channel,
               std::chrono::milliseconds interval = std::chrono::milliseconds(100));

  // Returns false if the signal mask could not be changed.
  static bool blockTerminationSignals();

  void run();

private:
  Session& session_;
  CommandChannel& channel_;
  std::chrono::milliseconds interval_;
};

}  // namespace vprompter

#endif  // VPROMPTER_SIGNAL_SOURCE_H
