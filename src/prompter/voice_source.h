/*
VoicePrompter — Voice input source.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_VOICE_SOURCE_H
#define VPROMPTER_VOICE_SOURCE_H

#include "command_channel.h"
#include "session.h"
#include "speech_backend.h"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace vprompter {

// When a transcript counts as "said".
enum class VoiceTrigger {
  // Any recognized speech.
  Speech,
  // At least minWords words.
  Words,
  // Bag-of-words match against the expected unit. Falls back to Words when
  // no unit is published (marquee mode).
  Match,
};

bool parseVoiceTrigger(std::string_view name, VoiceTrigger& out);
const char* voiceTriggerName(VoiceTrigger trigger);

struct VoiceOptions {
  VoiceTrigger trigger = VoiceTrigger::Match;
  std::size_t minWords = 3;
  double matchThreshold = 0.4;
  CaptureRequest capture;
  std::string locale = "en-us";

  std::chrono::milliseconds idleInterval{100};
  // After a Next, how long to wait for the engine to publish the following
  // unit before listening again.
  std::chrono::milliseconds settleTimeout{250};
  // Backend failures are retried: backoff starts here and doubles up to
  // maxBackoff. They never advance the cursor.
  std::chrono::milliseconds initialBackoff{250};
  std::chrono::milliseconds maxBackoff{4000};
};

// Pure decision used by the voice loop.
bool shouldAdvance(std::string_view transcript, std::string_view expectedUnit,
                   const VoiceOptions& options);

struct VoiceStats {
  std::size_t captures = 0;
  std::size_t timeouts = 0;
  std::size_t unrecognized = 0;
  std::size_t rejected = 0;  // transcript did not count as said
  std::size_t stale = 0;     // cursor moved while capturing
  std::size_t backendErrors = 0;
  std::size_t emitted = 0;
};

// Captures audio, transcribes it and pushes Next when the speaker has said
// the current unit. Runs on its own thread; exits when the session stops,
// or when the microphone fails (voice is then marked unavailable).
class VoiceSource {
public:
  VoiceSource(Session& session, CommandChannel& channel, SpeechBackend& backend,
              VoiceOptions options);

  void run();

  // Only meaningful once run() has returned.
  const VoiceStats& stats() const { return stats_; }

private:
  void handleTranscript(const std::string& text, const UnitMailbox::Snapshot& before);

  Session& session_;
  CommandChannel& channel_;
  SpeechBackend& backend_;
  VoiceOptions options_;
  VoiceStats stats_;
};

}  // namespace vprompter

#endif  // VPROMPTER_VOICE_SOURCE_H
