/*
VoicePrompter — Key press decoding for the keyboard source.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_KEY_DECODER_H
#define VPROMPTER_KEY_DECODER_H

#include "command.h"

#include <optional>

namespace vprompter {

// Which key table applies. The continuous policy uses the arrows and the
// space bar for speed and pause instead of stepping.
enum class KeyMap {
  Discrete,
  Continuous,
};

// Byte-at-a-time decoder for a cbreak terminal.
//
// Arrow keys arrive as ESC [ C / ESC [ D (or ESC O C / ESC O D in
// application cursor mode). Other escape sequences are swallowed.
class KeyDecoder {
public:
  explicit KeyDecoder(KeyMap map) : map_(map) {}

  // Returns the command for a completed key, if it maps to one.
  std::optional<Command> feed(unsigned char byte,
                              Command::Clock::time_point when = Command::Clock::now());

  // No byte arrived within a poll interval. A lone ESC is dropped.
  void timeout() { esc_ = Esc::None; }

  bool pending() const { return esc_ != Esc::None; }

  KeyMap keyMap() const { return map_; }

private:
  enum class Esc {
    None,
    Start,     // got ESC
    Csi,       // got ESC [ or ESC O
  };

  enum class Key {
    Confirm,   // space, enter
    Forward,   // n, right arrow
    Back,      // b, left arrow
    Quit,
    Voice,
    Zero,
    One,
    Two,
  };

  std::optional<Command> decodePlain(unsigned char byte, Command::Clock::time_point when);
  std::optional<Command> mapKey(Key key, Command::Clock::time_point when) const;

  KeyMap map_;
  Esc esc_ = Esc::None;
};

}  // namespace vprompter

#endif  // VPROMPTER_KEY_DECODER_H
