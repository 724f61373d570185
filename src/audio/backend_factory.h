/*
VoicePrompter — Construction of the speech backend.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_BACKEND_FACTORY_H
#define VPROMPTER_BACKEND_FACTORY_H

#include "prompter/settings.h"
#include "prompter/speech_backend.h"

#include <memory>

namespace vprompter {

// nullptr when the program was built without a recognizer.
std::unique_ptr<SpeechBackend> createSpeechBackend(const Settings& settings);

// True if createSpeechBackend can return something.
bool speechBackendCompiledIn();

}  // namespace vprompter

#endif  // VPROMPTER_BACKEND_FACTORY_H
