/*
VoicePrompter — Construction of the speech backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "backend_factory.h"

#if VPROMPTER_HAVE_VOSK
#include "vosk_backend.h"
#endif

#include <utility>

namespace vprompter {

std::unique_ptr<SpeechBackend> createSpeechBackend(const Settings& settings) {
#if VPROMPTER_HAVE_VOSK
  VoskOptions o;
  o.modelPath = settings.modelPath;
  o.device = settings.device;
  o.energyThreshold = settings.energyThreshold;
  return std::make_unique<VoskBackend>(std::move(o));
#else
  (void)settings;
  return nullptr;
#endif
}

bool speechBackendCompiledIn() {
#if VPROMPTER_HAVE_VOSK
  return true;
#else
  return false;
#endif
}

}  // namespace vprompter
