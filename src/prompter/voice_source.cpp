/*
VoicePrompter — Voice input source.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "voice_source.h"

#include "debug_log.h"
#include "speech_matcher.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace vprompter {

bool parseVoiceTrigger(std::string_view name, VoiceTrigger& out) {
  std::string s;
  s.reserve(name.size());
  for (char c : name) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (s == "speech" || s == "any") { out = VoiceTrigger::Speech; return true; }
  if (s == "words") { out = VoiceTrigger::Words; return true; }
  if (s == "match") { out = VoiceTrigger::Match; return true; }
  return false;
}

const char* voiceTriggerName(VoiceTrigger trigger) {
  switch (trigger) {
    case VoiceTrigger::Speech: return "speech";
    case VoiceTrigger::Words: return "words";
    case VoiceTrigger::Match: return "match";
  }
  return "match";
}

bool shouldAdvance(std::string_view transcript, std::string_view expectedUnit,
                   const VoiceOptions& options) {
  switch (options.trigger) {
    case VoiceTrigger::Speech:
      return wordCountAtLeast(transcript, 1);
    case VoiceTrigger::Words:
      return wordCountAtLeast(transcript, options.minWords);
    case VoiceTrigger::Match:
      if (expectedUnit.empty()) return wordCountAtLeast(transcript, options.minWords);
      return isMatch(transcript, expectedUnit, options.matchThreshold);
  }
  return false;
}

VoiceSource::VoiceSource(Session& session, CommandChannel& channel, SpeechBackend& backend,
                         VoiceOptions options)
    : session_(session), channel_(channel), backend_(backend), options_(std::move(options)) {}

void VoiceSource::handleTranscript(const std::string& text, const UnitMailbox::Snapshot& before) {
  // The keyboard may have moved the cursor while we were listening; the
  // speech belonged to a unit that is no longer on screen.
  if (session_.expected.generation() != before.generation) {
    ++stats_.stale;
    DEBUG_LOG("voice: dropping stale transcript \"%s\"", text.c_str());
    return;
  }
  if (!session_.voiceActive()) {
    DEBUG_LOG("voice: turned off while listening, ignoring \"%s\"", text.c_str());
    return;
  }

  if (!shouldAdvance(text, before.unit, options_)) {
    ++stats_.rejected;
    DEBUG_LOG("voice: \"%s\" not enough (ratio %.2f)", text.c_str(), matchRatio(text, before.unit));
    return;
  }

  if (!channel_.push(Command::make(CommandType::Next, CommandSource::Voice))) return;
  ++stats_.emitted;
  DEBUG_LOG("voice: \"%s\" -> Next", text.c_str());

  // Listen for the next unit, not the one just finished.
  if (!session_.expected.waitForChange(before.generation, options_.settleTimeout)) {
    DEBUG_LOG("voice: cursor did not move after Next");
  }
}

void VoiceSource::run() {
  DEBUG_LOG("voice: started (%s backend, trigger=%s)", backend_.name(),
            voiceTriggerName(options_.trigger));

  auto backoff = options_.initialBackoff;
  while (!session_.stop.stopRequested()) {
    if (!session_.voiceActive()) {
      session_.stop.waitFor(options_.idleInterval);
      continue;
    }

    const UnitMailbox::Snapshot before = session_.expected.snapshot();
    CaptureResult captured = backend_.capture(options_.capture, session_.stop);
    if (session_.stop.stopRequested()) break;

    if (captured.status == CaptureStatus::Timeout) {
      ++stats_.timeouts;
      continue;
    }
    if (captured.status == CaptureStatus::DeviceError) {
      DEBUG_LOG("voice: microphone lost (%s), switching to keyboard only", captured.error.c_str());
      session_.setVoiceAvailable(false);
      break;
    }

    ++stats_.captures;
    const Transcription heard = backend_.transcribe(captured.clip, options_.locale);
    switch (heard.status) {
      case TranscriptionStatus::Unrecognized:
        ++stats_.unrecognized;
        break;

      case TranscriptionStatus::BackendError:
        ++stats_.backendErrors;
        DEBUG_LOG("voice: backend error (%s), retrying in %lld ms", heard.error.c_str(),
                  static_cast<long long>(backoff.count()));
        if (session_.stop.waitFor(backoff)) break;
        backoff = std::min(backoff * 2, options_.maxBackoff);
        break;

      case TranscriptionStatus::Ok:
        backoff = options_.initialBackoff;
        handleTranscript(heard.text, before);
        break;
    }
  }

  DEBUG_LOG("voice: stopped (%zu captures, %zu emitted)", stats_.captures, stats_.emitted);
}

}  // namespace vprompter
