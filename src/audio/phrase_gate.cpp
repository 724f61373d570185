/*
VoicePrompter — Energy-gated phrase detection on captured audio.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "phrase_gate.h"

#include <cmath>
#include <utility>

namespace vprompter {

namespace {

constexpr std::size_t kPreRollPeriods = 8;

}  // namespace

double rmsLevel(const int16_t* samples, std::size_t count) {
  if (!samples || count == 0) return 0.0;
  double sum = 0.0;
  for (std::size_t i = 0; i < count; ++i) {
    const double s = samples[i];
    sum += s * s;
  }
  return std::sqrt(sum / static_cast<double>(count));
}

PhraseGate::PhraseGate(const CaptureRequest& request, double energyThreshold,
                       unsigned int sampleRate)
    : request_(request),
      threshold_(energyThreshold),
      sampleRate_(sampleRate ? sampleRate : 16000) {}

double PhraseGate::ms(std::size_t samples) const {
  return 1000.0 * static_cast<double>(samples) / static_cast<double>(sampleRate_);
}

PhraseGate::State PhraseGate::feed(const int16_t* samples, std::size_t count) {
  if (state_ == State::Done || state_ == State::TimedOut || count == 0) return state_;

  const bool loud = rmsLevel(samples, count) >= threshold_;

  if (state_ == State::Waiting) {
    if (!loud) {
      preRoll_.emplace_back(samples, samples + count);
      if (preRoll_.size() > kPreRollPeriods) preRoll_.pop_front();
      waited_ += count;
      if (ms(waited_) >= static_cast<double>(request_.timeout.count())) {
        state_ = State::TimedOut;
      }
      return state_;
    }

    for (const auto& p : preRoll_) phrase_.insert(phrase_.end(), p.begin(), p.end());
    preRoll_.clear();
    state_ = State::Recording;
  }

  phrase_.insert(phrase_.end(), samples, samples + count);
  recorded_ += count;
  quiet_ = loud ? 0 : quiet_ + count;

  if (ms(quiet_) >= static_cast<double>(request_.pause.count()) ||
      ms(recorded_) >= static_cast<double>(request_.maxPhrase.count())) {
    state_ = State::Done;
  }
  return state_;
}

AudioClip PhraseGate::takeClip() {
  AudioClip clip;
  clip.sampleRate = sampleRate_;
  clip.samples = std::move(phrase_);
  phrase_.clear();
  return clip;
}

}  // namespace vprompter
