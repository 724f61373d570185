/*
VoicePrompter — ALSA capture and Vosk offline recognition.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_VOSK_BACKEND_H
#define VPROMPTER_VOSK_BACKEND_H

#include "prompter/speech_backend.h"

#include <memory>
#include <string>

namespace vprompter {

struct VoskOptions {
  std::string modelPath;
  std::string device = "default";
  double energyThreshold = 300.0;
  unsigned int sampleRate = 16000;
};

// Extracts the "text" member from a Vosk result object. Empty if missing.
std::string extractResultText(const std::string& json);

class VoskBackend : public SpeechBackend {
public:
  explicit VoskBackend(VoskOptions options);
  ~VoskBackend() override;

  VoskBackend(const VoskBackend&) = delete;
  VoskBackend& operator=(const VoskBackend&) = delete;

  bool open(std::string& outError) override;
  CaptureResult capture(const CaptureRequest& request, const StopToken& stop) override;
  Transcription transcribe(const AudioClip& clip, const std::string& locale) override;
  const char* name() const override { return "vosk"; }

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace vprompter

#endif  // VPROMPTER_VOSK_BACKEND_H
