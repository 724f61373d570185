/*
VoicePrompter — Speech-to-text backend interface.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_SPEECH_BACKEND_H
#define VPROMPTER_SPEECH_BACKEND_H

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace vprompter {

class StopToken;

// Mono 16-bit PCM.
struct AudioClip {
  std::vector<int16_t> samples;
  unsigned int sampleRate = 16000;

  double seconds() const {
    return sampleRate ? static_cast<double>(samples.size()) / sampleRate : 0.0;
  }
};

struct CaptureRequest {
  // How long to wait for speech to start.
  std::chrono::milliseconds timeout{500};
  // Hard cap on one phrase.
  std::chrono::milliseconds maxPhrase{10000};
  // Silence that ends a phrase.
  std::chrono::milliseconds pause{1500};
};

enum class CaptureStatus {
  Ok,
  // No speech started within the timeout, or a stop was requested.
  Timeout,
  // The microphone went away.
  DeviceError,
};

struct CaptureResult {
  CaptureStatus status = CaptureStatus::Timeout;
  AudioClip clip;
  std::string error;
};

enum class TranscriptionStatus {
  Ok,
  // Audio was captured but nothing intelligible came out (background noise).
  Unrecognized,
  // The recognizer itself failed.
  BackendError,
};

struct Transcription {
  TranscriptionStatus status = TranscriptionStatus::Unrecognized;
  std::string text;
  std::string error;
};

// Opaque recognition capability. The prompter never looks inside the audio.
// All calls come from the voice source thread.
class SpeechBackend {
public:
  virtual ~SpeechBackend() = default;

  // Acquires the microphone and recognizer. False (with outError) means no
  // usable device; the prompter then runs keyboard-only.
  virtual bool open(std::string& outError) = 0;

  // Blocks for at most about timeout + maxPhrase, and returns Timeout
  // within one audio period once stop is requested.
  virtual CaptureResult capture(const CaptureRequest& request, const StopToken& stop) = 0;

  virtual Transcription transcribe(const AudioClip& clip, const std::string& locale) = 0;

  virtual const char* name() const = 0;
};

}  // namespace vprompter

#endif  // VPROMPTER_SPEECH_BACKEND_H
