/*
VoicePrompter — Keyboard input source.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_KEYBOARD_SOURCE_H
#define VPROMPTER_KEYBOARD_SOURCE_H

#include "prompter/command_channel.h"
#include "prompter/key_decoder.h"
#include "prompter/session.h"

#include <chrono>
#include <cstddef>

#include <unistd.h>

namespace vprompter {

struct KeyboardOptions {
  int fd = STDIN_FILENO;
  // Switch fd into cbreak mode for the lifetime of run(). Off for pipes.
  bool rawMode = true;
  std::chrono::milliseconds pollInterval{30};
};

// Reads key presses and pushes the mapped commands. Runs on its own thread
// until the session stops or the input reaches end-of-file. End-of-file
// does not quit the session.
class KeyboardSource {
public:
  KeyboardSource(Session& session, CommandChannel& channel, KeyMap keyMap,
                 KeyboardOptions options = {});

  void run();

  std::size_t emitted() const { return emitted_; }

private:
  void loop();

  Session& session_;
  CommandChannel& channel_;
  KeyDecoder decoder_;
  KeyboardOptions options_;
  std::size_t emitted_ = 0;
};

}  // namespace vprompter

#endif  // VPROMPTER_KEYBOARD_SOURCE_H
