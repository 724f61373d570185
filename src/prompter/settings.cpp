/*
VoicePrompter — Settings: defaults, settings file and command line.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "settings.h"

#include "errors.h"
#include "yaml_min.h"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <vector>

#ifndef VPROMPTER_VERSION
#define VPROMPTER_VERSION "0.3.0"
#endif

namespace vprompter {

namespace {

// ============================================================================
// Settings file
// ============================================================================

using Apply = std::function<bool(const yaml_min::Node&, Settings&)>;

struct KeyHandler {
  const char* path;
  Apply apply;
};

bool readBool(const yaml_min::Node& n, bool& out) {
  return n.asBool(out);
}

bool readDouble(const yaml_min::Node& n, double& out) {
  return n.asNumber(out);
}

bool readCount(const yaml_min::Node& n, std::size_t& out) {
  double v = 0.0;
  if (!n.asNumber(v) || v < 0.0 || v != std::floor(v)) return false;
  out = static_cast<std::size_t>(v);
  return true;
}

bool readString(const yaml_min::Node& n, std::string& out) {
  if (!n.isScalar()) return false;
  out = n.scalar;
  return true;
}

const std::vector<KeyHandler>& keyHandlers() {
  static const std::vector<KeyHandler> handlers = {
    // Flat is implied by scroll.enabled, never chosen directly.
    {"segment.mode", [](const yaml_min::Node& n, Settings& s) {
       SegmentMode m = s.segmentMode;
       if (!n.isScalar() || !parseSegmentMode(n.scalar, m) || m == SegmentMode::Flat) return false;
       s.segmentMode = m;
       return true; }},
    {"segment.max_chars", [](const yaml_min::Node& n, Settings& s) { return readCount(n, s.maxUnitChars); }},
    {"voice.enabled", [](const yaml_min::Node& n, Settings& s) { return readBool(n, s.voiceEnabled); }},
    {"voice.trigger", [](const yaml_min::Node& n, Settings& s) {
       return n.isScalar() && parseVoiceTrigger(n.scalar, s.trigger); }},
    {"voice.min_words", [](const yaml_min::Node& n, Settings& s) { return readCount(n, s.minWords); }},
    {"voice.pause_threshold", [](const yaml_min::Node& n, Settings& s) { return readDouble(n, s.pauseSeconds); }},
    {"voice.match_threshold", [](const yaml_min::Node& n, Settings& s) { return readDouble(n, s.matchThreshold); }},
    {"voice.capture_timeout", [](const yaml_min::Node& n, Settings& s) { return readDouble(n, s.captureTimeoutSeconds); }},
    {"voice.max_phrase", [](const yaml_min::Node& n, Settings& s) { return readDouble(n, s.maxPhraseSeconds); }},
    {"voice.energy_threshold", [](const yaml_min::Node& n, Settings& s) { return readDouble(n, s.energyThreshold); }},
    {"voice.locale", [](const yaml_min::Node& n, Settings& s) { return readString(n, s.locale); }},
    {"voice.model", [](const yaml_min::Node& n, Settings& s) { return readString(n, s.modelPath); }},
    {"voice.device", [](const yaml_min::Node& n, Settings& s) { return readString(n, s.device); }},
    {"scroll.enabled", [](const yaml_min::Node& n, Settings& s) { return readBool(n, s.scroll); }},
    {"scroll.base_speed", [](const yaml_min::Node& n, Settings& s) { return readDouble(n, s.baseSpeed); }},
    {"logging.enabled", [](const yaml_min::Node& n, Settings& s) { return readBool(n, s.loggingEnabled); }},
    {"logging.file", [](const yaml_min::Node& n, Settings& s) { return readString(n, s.logFile); }},
  };
  return handlers;
}

const KeyHandler* findHandler(const std::string& path) {
  for (const auto& h : keyHandlers()) {
    if (path == h.path) return &h;
  }
  return nullptr;
}

std::chrono::milliseconds secondsToMs(double s) {
  return std::chrono::milliseconds(static_cast<long long>(std::llround(s * 1000.0)));
}

// ============================================================================
// Command line
// ============================================================================

bool parseInt(const char* s, long& out) {
  if (!s || !*s) return false;
  char* end = nullptr;
  long v = std::strtol(s, &end, 10);
  if (!end || *end != '\0') return false;
  out = v;
  return true;
}

bool parseDouble(const char* s, double& out) {
  if (!s || !*s) return false;
  char* end = nullptr;
  double v = std::strtod(s, &end);
  if (!end || *end != '\0') return false;
  out = v;
  return true;
}

}  // namespace

bool applySettingsNode(const yaml_min::Node& root, Settings& inOut, std::string& outError) {
  if (!root.isMap()) {
    outError = "Settings file must be a map";
    return false;
  }

  for (const auto& section : root.map) {
    if (!section.second.isMap()) {
      outError = "Expected a section map for '" + section.first + "'";
      return false;
    }
    for (const auto& entry : section.second.map) {
      const std::string path = section.first + "." + entry.first;
      const KeyHandler* h = findHandler(path);
      if (!h) {
        outError = "Unknown setting '" + path + "'";
        return false;
      }
      if (!h->apply(entry.second, inOut)) {
        outError = "Bad value for '" + path + "'";
        return false;
      }
    }
  }
  return true;
}

bool loadSettingsFile(const std::string& path, Settings& inOut, std::string& outError) {
  yaml_min::Node root;
  if (!yaml_min::loadFile(path, root, outError)) return false;

  std::string err;
  if (!applySettingsNode(root, inOut, err)) {
    outError = path + ": " + err;
    return false;
  }
  return true;
}

void validateSettings(const Settings& s) {
  if (!(s.matchThreshold > 0.0 && s.matchThreshold <= 1.0)) {
    throw ConfigError("Match threshold must be in (0, 1]");
  }
  if (s.minWords < 1) {
    throw ConfigError("Minimum word count must be at least 1");
  }
  if (!(s.pauseSeconds > 0.0 && s.pauseSeconds <= 10.0)) {
    throw ConfigError("Pause threshold must be in (0, 10] seconds");
  }
  if (!(s.captureTimeoutSeconds > 0.0 && s.captureTimeoutSeconds <= 60.0)) {
    throw ConfigError("Capture timeout must be in (0, 60] seconds");
  }
  if (!(s.maxPhraseSeconds > 0.0 && s.maxPhraseSeconds <= 120.0)) {
    throw ConfigError("Maximum phrase duration must be in (0, 120] seconds");
  }
  if (!(s.energyThreshold >= 0.0)) {
    throw ConfigError("Energy threshold must not be negative");
  }
  if (!(s.baseSpeed > 0.0 && s.baseSpeed <= 1000.0)) {
    throw ConfigError("Scroll speed must be in (0, 1000] characters per second");
  }
  if (s.maxUnitChars != 0 && s.maxUnitChars < 20) {
    throw ConfigError("Maximum unit length must be 0 (no limit) or at least 20");
  }
}

VoiceOptions makeVoiceOptions(const Settings& s) {
  VoiceOptions o;
  o.trigger = s.trigger;
  o.minWords = s.minWords;
  o.matchThreshold = s.matchThreshold;
  o.locale = s.locale;
  o.capture.timeout = secondsToMs(s.captureTimeoutSeconds);
  o.capture.maxPhrase = secondsToMs(s.maxPhraseSeconds);
  o.capture.pause = secondsToMs(s.pauseSeconds);
  return o;
}

void printUsage(const char* argv0) {
  std::cerr
    << "Usage: " << (argv0 ? argv0 : "voicePrompter") << " [options] <script.txt>\n\n"
    << "Shows a script one phrase at a time and advances when you have said it.\n\n"
    << "Options:\n"
    << "  --manual               Keyboard only, do not use the microphone\n"
    << "  --scroll               Horizontal marquee instead of phrase stepping\n"
    << "  --mode <name>          sentence | paragraph (default: sentence)\n"
    << "  --max-chars <int>      Split longer sentences at commas (default: 150)\n"
    << "  --trigger <name>       speech | words | match (default: match)\n"
    << "  --min-words <int>      Words needed for the words trigger (default: 3)\n"
    << "  --pause <sec>          Silence that ends a phrase (default: 1.5)\n"
    << "  --threshold <0..1>     Fraction of phrase words to hear (default: 0.4)\n"
    << "  --timeout <sec>        Wait for speech to start (default: 0.5)\n"
    << "  --max-phrase <sec>     Longest phrase recorded (default: 10)\n"
    << "  --energy <float>       Speech energy gate (default: 300)\n"
    << "  --speed <cps>          Marquee base speed (default: 15)\n"
    << "  --lang <tag>           Recognizer locale (default: en-us)\n"
    << "  --model <dir>          Speech model directory\n"
    << "  --device <name>        Capture device (default: default)\n"
    << "  --config <file>        Settings file\n"
    << "  --log <file>           Write a debug log\n"
    << "  -v, --version          Show version\n"
    << "  -h, --help             Show this help\n"
    << "\n"
    << "Keys:\n"
    << "  SPACE/ENTER  next phrase (marquee: pause/resume)\n"
    << "  B            previous phrase\n"
    << "  V            voice on/off\n"
    << "  RIGHT/LEFT   marquee speed (tap again for 1.5x, 2x)\n"
    << "  Q            quit\n";
}

CommandLine parseCommandLine(int argc, const char* const* argv) {
  CommandLine cl;

  // Pass 1: the settings file goes underneath everything else.
  for (int i = 1; i + 1 < argc; ++i) {
    if (argv[i] && std::string(argv[i]) == "--config" && argv[i + 1]) {
      cl.configPath = argv[i + 1];
    }
  }
  if (!cl.configPath.empty()) {
    std::string err;
    if (!loadSettingsFile(cl.configPath, cl.settings, err)) {
      throw ConfigError(err);
    }
  }

  Settings& s = cl.settings;
  auto fail = [&](const std::string& msg) {
    if (cl.error.empty()) cl.error = msg;
    cl.help = true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i] ? argv[i] : "";

    auto requireValue = [&](const std::string& name) -> const char* {
      if (i + 1 >= argc || !argv[i + 1]) {
        fail("Missing value for " + name);
        return nullptr;
      }
      return argv[++i];
    };

    auto doubleArg = [&](double& target) {
      if (const char* v = requireValue(a)) {
        if (!parseDouble(v, target)) fail("Bad " + a + " value: " + v);
      }
    };

    auto countArg = [&](std::size_t& target) {
      if (const char* v = requireValue(a)) {
        long tmp = 0;
        if (!parseInt(v, tmp) || tmp < 0) {
          fail("Bad " + a + " value: " + v);
        } else {
          target = static_cast<std::size_t>(tmp);
        }
      }
    };

    if (a == "-h" || a == "--help") { cl.help = true; continue; }
    if (a == "-v" || a == "--version") { cl.version = true; continue; }
    if (a == "--manual") { s.voiceEnabled = false; continue; }
    if (a == "--scroll") { s.scroll = true; continue; }
    if (a == "--config") { requireValue(a); continue; }  // applied in pass 1

    if (a == "--mode") {
      if (const char* v = requireValue(a)) {
        if (!parseSegmentMode(v, s.segmentMode) || s.segmentMode == SegmentMode::Flat) {
          fail(std::string("Bad --mode value: ") + v + " (expected sentence or paragraph)");
        }
      }
      continue;
    }
    if (a == "--trigger") {
      if (const char* v = requireValue(a)) {
        if (!parseVoiceTrigger(v, s.trigger)) {
          fail(std::string("Bad --trigger value: ") + v + " (expected speech, words or match)");
        }
      }
      continue;
    }
    if (a == "--max-chars") { countArg(s.maxUnitChars); continue; }
    if (a == "--min-words") { countArg(s.minWords); continue; }
    if (a == "--pause") { doubleArg(s.pauseSeconds); continue; }
    if (a == "--threshold") { doubleArg(s.matchThreshold); continue; }
    if (a == "--timeout") { doubleArg(s.captureTimeoutSeconds); continue; }
    if (a == "--max-phrase") { doubleArg(s.maxPhraseSeconds); continue; }
    if (a == "--energy") { doubleArg(s.energyThreshold); continue; }
    if (a == "--speed") { doubleArg(s.baseSpeed); continue; }
    if (a == "--lang") {
      if (const char* v = requireValue(a)) s.locale = v;
      continue;
    }
    if (a == "--model") {
      if (const char* v = requireValue(a)) s.modelPath = v;
      continue;
    }
    if (a == "--device") {
      if (const char* v = requireValue(a)) s.device = v;
      continue;
    }
    if (a == "--log") {
      if (const char* v = requireValue(a)) {
        s.loggingEnabled = true;
        s.logFile = v;
      }
      continue;
    }

    if (!a.empty() && a[0] == '-' && a != "-") {
      fail("Unknown option: " + a);
      continue;
    }
    if (!cl.scriptPath.empty()) {
      fail("Only one script file may be given");
      continue;
    }
    cl.scriptPath = a;
  }

  if (!cl.help && !cl.version && cl.scriptPath.empty()) {
    fail("No script file given");
  }
  return cl;
}

const char* versionString() {
  return VPROMPTER_VERSION;
}

}  // namespace vprompter
