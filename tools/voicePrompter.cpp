/*
VoicePrompter — Command-line teleprompter that follows the speaker's voice.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.

Usage:
  voicePrompter [options] script.txt

Shows the script one phrase at a time and steps forward once the phrase has
been spoken. The keyboard always works as an override. With --scroll the
whole script runs as a single marquee line instead.

Exit codes: 0 on quit or completion, 1 on a configuration error,
2 on bad arguments.
*/

#include "audio/backend_factory.h"
#include "console/keyboard_source.h"
#include "console/signal_source.h"
#include "console/terminal_presenter.h"
#include "prompter/command_channel.h"
#include "prompter/continuous_policy.h"
#include "prompter/debug_log.h"
#include "prompter/discrete_policy.h"
#include "prompter/engine.h"
#include "prompter/errors.h"
#include "prompter/segmenter.h"
#include "prompter/session.h"
#include "prompter/settings.h"
#include "prompter/voice_source.h"
#include "prompter/worker_group.h"

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

using namespace vprompter;

namespace {

void setupLogging(const Settings& s) {
  if (!s.loggingEnabled) return;
  DebugLog::SetPath(s.logFile);
  DebugLog::SetEnabled(true);
  DebugLog::ClearLog();
  DEBUG_LOG("voicePrompter %s starting", versionString());
}

// Opens the microphone if voice is wanted. Returns nullptr for keyboard-only.
std::unique_ptr<SpeechBackend> openBackend(const Settings& s) {
  if (!s.voiceEnabled) return nullptr;

  if (!speechBackendCompiledIn()) {
    std::cerr << "Warning: built without speech recognition, using keyboard only.\n";
    return nullptr;
  }

  std::unique_ptr<SpeechBackend> backend = createSpeechBackend(s);

  std::string err;
  if (!backend->open(err)) {
    std::cerr << "Warning: microphone not available (" << err << "), using keyboard only.\n";
    DEBUG_LOG("backend %s failed to open: %s", backend->name(), err.c_str());
    return nullptr;
  }
  return backend;
}

int runPrompter(const Settings& s, const std::string& scriptPath) {
  validateSettings(s);
  setupLogging(s);

  const std::string text = loadScriptFile(scriptPath);
  const SegmentMode mode = s.scroll ? SegmentMode::Flat : s.segmentMode;
  std::vector<std::string> units = segment(text, mode, s.maxUnitChars);
  DEBUG_LOG("script %s: %zu units (%s)", scriptPath.c_str(), units.size(), segmentModeName(mode));

  // Before any thread exists, including ones the recognizer may start.
  if (!SignalSource::blockTerminationSignals()) {
    DEBUG_LOG("could not block SIGINT/SIGTERM");
  }

  std::unique_ptr<SpeechBackend> backend = openBackend(s);

  Session session;
  session.setVoiceAvailable(backend != nullptr);
  session.setVoiceEnabled(backend != nullptr);

  CommandChannel channel;
  TerminalPresenter presenter(std::cout, STDOUT_FILENO);

  std::unique_ptr<AdvancementPolicy> policy;
  if (s.scroll) {
    policy = std::make_unique<ContinuousPolicy>(units.front(), presenter.viewportWidth(), s.baseSpeed);
  } else {
    policy = std::make_unique<DiscretePolicy>(std::move(units));
  }

  KeyboardSource keyboard(session, channel, s.scroll ? KeyMap::Continuous : KeyMap::Discrete);
  SignalSource signals(session, channel);
  std::unique_ptr<VoiceSource> voice;
  if (backend) {
    voice = std::make_unique<VoiceSource>(session, channel, *backend, makeVoiceOptions(s));
  }

  EngineResult result = EngineResult::Stopped;
  std::string workerError;
  {
    WorkerGroup workers(session.stop);
    workers.spawn("keyboard", [&keyboard]() { keyboard.run(); });
    workers.spawn("signals", [&signals]() { signals.run(); });
    if (voice) workers.spawn("voice", [&voice]() { voice->run(); });

    Engine engine(session, channel, *policy, presenter);
    result = engine.run();

    workers.joinAll();
    workerError = workers.firstError();
  }

  presenter.showFinished();
  DEBUG_LOG("session ended: %s", engineResultName(result));

  if (!workerError.empty()) {
    std::cerr << "Error: " << workerError << "\n";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  const char* argv0 = argv && argv[0] ? argv[0] : "voicePrompter";

  CommandLine cl;
  try {
    cl = parseCommandLine(argc, argv);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (!cl.error.empty()) {
    std::cerr << "Error: " << cl.error << "\n\n";
    printUsage(argv0);
    return 2;
  }
  if (cl.help) {
    printUsage(argv0);
    return 0;
  }
  if (cl.version) {
    std::cout << "voicePrompter " << versionString() << "\n";
    return 0;
  }

  try {
    return runPrompter(cl.settings, cl.scriptPath);
  } catch (const ConfigError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const TerminalError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
