/*
VoicePrompter — Key press decoding for the keyboard source.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "key_decoder.h"

namespace vprompter {

namespace {

constexpr unsigned char kEsc = 0x1B;
constexpr unsigned char kCtrlC = 0x03;

}  // namespace

std::optional<Command> KeyDecoder::feed(unsigned char byte, Command::Clock::time_point when) {
  switch (esc_) {
    case Esc::Start:
      if (byte == '[' || byte == 'O') {
        esc_ = Esc::Csi;
        return std::nullopt;
      }
      // ESC followed by an ordinary key: treat the ESC as noise.
      esc_ = Esc::None;
      return decodePlain(byte, when);

    case Esc::Csi:
      // Parameter and intermediate bytes keep the sequence open.
      if (byte >= 0x20 && byte <= 0x3F) return std::nullopt;
      esc_ = Esc::None;
      if (byte == 'C') return mapKey(Key::Forward, when);
      if (byte == 'D') return mapKey(Key::Back, when);
      return std::nullopt;

    case Esc::None:
      break;
  }
  return decodePlain(byte, when);
}

std::optional<Command> KeyDecoder::decodePlain(unsigned char byte, Command::Clock::time_point when) {
  switch (byte) {
    case kEsc:
      esc_ = Esc::Start;
      return std::nullopt;
    case kCtrlC:
      return mapKey(Key::Quit, when);
    case ' ':
    case '\n':
    case '\r':
      return mapKey(Key::Confirm, when);
    case 'n': case 'N':
      return mapKey(Key::Forward, when);
    case 'b': case 'B':
      return mapKey(Key::Back, when);
    case 'q': case 'Q':
      return mapKey(Key::Quit, when);
    case 'v': case 'V':
      return mapKey(Key::Voice, when);
    case '0':
      return mapKey(Key::Zero, when);
    case '1':
      return mapKey(Key::One, when);
    case '2':
      return mapKey(Key::Two, when);
    default:
      return std::nullopt;
  }
}

std::optional<Command> KeyDecoder::mapKey(Key key, Command::Clock::time_point when) const {
  const CommandSource src = CommandSource::Keyboard;

  switch (key) {
    case Key::Quit:
      return Command::make(CommandType::Quit, src, when);
    case Key::Voice:
      return Command::make(CommandType::ToggleVoice, src, when);
    default:
      break;
  }

  if (map_ == KeyMap::Discrete) {
    switch (key) {
      case Key::Confirm:
      case Key::Forward:
        return Command::make(CommandType::Next, src, when);
      case Key::Back:
        return Command::make(CommandType::Previous, src, when);
      default:
        return std::nullopt;
    }
  }

  switch (key) {
    case Key::Confirm:
      return Command::make(CommandType::TogglePause, src, when);
    case Key::Forward:
      return Command::speed(SpeedMode::Delta, 1.0, src, when);
    case Key::Back:
      return Command::speed(SpeedMode::Delta, -1.0, src, when);
    case Key::Zero:
      return Command::speed(SpeedMode::Absolute, 0.0, src, when);
    case Key::One:
      return Command::speed(SpeedMode::Absolute, 1.0, src, when);
    case Key::Two:
      return Command::speed(SpeedMode::Absolute, 2.0, src, when);
    default:
      return std::nullopt;
  }
}

}  // namespace vprompter
