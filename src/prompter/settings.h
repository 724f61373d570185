/*
VoicePrompter — Settings: defaults, settings file and command line.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_SETTINGS_H
#define VPROMPTER_SETTINGS_H

#include "segmenter.h"
#include "voice_source.h"

#include <cstddef>
#include <string>

namespace vprompter {

namespace yaml_min { struct Node; }

struct Settings {
  // Script
  SegmentMode segmentMode = SegmentMode::Sentence;
  std::size_t maxUnitChars = kDefaultMaxUnitChars;

  // Voice
  bool voiceEnabled = true;           // false == --manual
  VoiceTrigger trigger = VoiceTrigger::Match;
  std::size_t minWords = 3;
  double pauseSeconds = 1.5;          // silence that ends a phrase
  double matchThreshold = 0.4;
  double captureTimeoutSeconds = 0.5; // wait for speech to start
  double maxPhraseSeconds = 10.0;
  double energyThreshold = 300.0;     // RMS gate on 16-bit samples
  std::string locale = "en-us";
  std::string modelPath;              // speech model directory
  std::string device = "default";     // capture device

  // Marquee
  bool scroll = false;
  double baseSpeed = 15.0;            // code points per second

  // Logging
  bool loggingEnabled = false;
  std::string logFile;                // empty => default temp path
};

// Overlays values present in a parsed settings file. Unknown keys are
// reported as errors so that typos do not pass silently.
// Returns false and sets outError on a bad key or value.
bool applySettingsNode(const yaml_min::Node& root, Settings& inOut, std::string& outError);

// Loads a settings file on top of inOut.
bool loadSettingsFile(const std::string& path, Settings& inOut, std::string& outError);

// Range checks. Throws ConfigError.
void validateSettings(const Settings& settings);

// Builds the voice source options from settings.
VoiceOptions makeVoiceOptions(const Settings& settings);

struct CommandLine {
  Settings settings;
  std::string scriptPath;
  std::string configPath;
  bool help = false;
  bool version = false;
  // Non-empty when the arguments were unusable; help is also set.
  std::string error;
};

// Parses argv. A --config file is applied first, then every other option
// overrides it, regardless of the order they were given in.
// Throws ConfigError if the settings file cannot be loaded.
CommandLine parseCommandLine(int argc, const char* const* argv);

void printUsage(const char* argv0);

const char* versionString();

}  // namespace vprompter

#endif  // VPROMPTER_SETTINGS_H
