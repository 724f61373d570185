/*
VoicePrompter — Energy-gated phrase detection on captured audio.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_PHRASE_GATE_H
#define VPROMPTER_PHRASE_GATE_H

#include "prompter/speech_backend.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace vprompter {

// Root mean square of 16-bit samples. 0 for an empty buffer.
double rmsLevel(const int16_t* samples, std::size_t count);

// Cuts one phrase out of a stream of fixed-size audio periods.
//
//   Waiting    no period above the threshold yet; a few recent quiet periods
//              are kept as pre-roll so the first syllable is not clipped.
//   Recording  started by a loud period; ends after `pause` of quiet or
//              once the phrase reaches `maxPhrase`.
//   TimedOut   nothing loud within `timeout`.
class PhraseGate {
public:
  enum class State {
    Waiting,
    Recording,
    Done,
    TimedOut,
  };

  PhraseGate(const CaptureRequest& request, double energyThreshold, unsigned int sampleRate);

  // Feeds one period. Returns the state after it.
  State feed(const int16_t* samples, std::size_t count);

  State state() const { return state_; }

  // Pre-roll plus recorded audio.
  AudioClip takeClip();

private:
  double ms(std::size_t samples) const;

  CaptureRequest request_;
  double threshold_;
  unsigned int sampleRate_;

  State state_ = State::Waiting;
  std::size_t waited_ = 0;    // samples seen while waiting
  std::size_t recorded_ = 0;  // samples since the phrase started
  std::size_t quiet_ = 0;     // trailing quiet samples while recording

  std::deque<std::vector<int16_t>> preRoll_;
  std::vector<int16_t> phrase_;
};

}  // namespace vprompter

#endif  // VPROMPTER_PHRASE_GATE_H
