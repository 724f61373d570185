/*
VoicePrompter — Test doubles shared by the unit tests.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_TEST_SUPPORT_H
#define VPROMPTER_TEST_SUPPORT_H

#include "prompter/presenter.h"
#include "prompter/session.h"
#include "prompter/speech_backend.h"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace vprompter {
namespace test {

// Scripted backend: each capture() consumes one step. When the script runs
// out it requests a stop on the session so VoiceSource::run() returns.
class FakeSpeechBackend : public SpeechBackend {
public:
  struct Step {
    CaptureStatus capture = CaptureStatus::Ok;
    TranscriptionStatus transcription = TranscriptionStatus::Ok;
    std::string text;
  };

  explicit FakeSpeechBackend(Session& session) : session_(session) {}

  static Step heard(std::string text) {
    Step s;
    s.text = std::move(text);
    return s;
  }
  static Step silence() {
    Step s;
    s.capture = CaptureStatus::Timeout;
    return s;
  }
  static Step deviceLost() {
    Step s;
    s.capture = CaptureStatus::DeviceError;
    return s;
  }
  static Step noise() {
    Step s;
    s.transcription = TranscriptionStatus::Unrecognized;
    return s;
  }
  static Step failure() {
    Step s;
    s.transcription = TranscriptionStatus::BackendError;
    return s;
  }

  void add(Step step) {
    std::lock_guard<std::mutex> lock(mtx_);
    steps_.push_back(std::move(step));
  }

  // Runs inside capture(), e.g. to move the cursor while "listening".
  std::function<void()> onCapture;

  bool open(std::string& outError) override {
    if (!openOk) outError = "no device";
    return openOk;
  }

  CaptureResult capture(const CaptureRequest&, const StopToken&) override {
    ++captures;
    if (onCapture) onCapture();

    CaptureResult r;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (steps_.empty()) {
        session_.stop.requestStop();
        r.status = CaptureStatus::Timeout;
        return r;
      }
      current_ = steps_.front();
      steps_.pop_front();
    }
    r.status = current_.capture;
    if (r.status == CaptureStatus::Ok) r.clip.samples.assign(1600, 0);
    if (r.status == CaptureStatus::DeviceError) r.error = "unplugged";
    return r;
  }

  Transcription transcribe(const AudioClip&, const std::string& locale) override {
    lastLocale = locale;
    Transcription t;
    t.status = current_.transcription;
    t.text = current_.text;
    if (t.status == TranscriptionStatus::BackendError) t.error = "recognizer crashed";
    return t;
  }

  const char* name() const override { return "fake"; }

  bool openOk = true;
  std::size_t captures = 0;
  std::string lastLocale;

private:
  Session& session_;
  std::mutex mtx_;
  std::deque<Step> steps_;
  Step current_;
};

// Remembers every call instead of drawing.
class RecordingPresenter : public Presenter {
public:
  struct UnitFrame {
    std::string unit;
    std::size_t index = 0;
    std::size_t total = 0;
    bool voiceOn = false;
  };
  struct MarqueeFrame {
    double offset = 0.0;
    double progress = 0.0;
    std::string indicator;
  };

  void showUnit(const std::string& unit, std::size_t index, std::size_t total,
                bool voiceOn) override {
    units.push_back(UnitFrame{unit, index, total, voiceOn});
  }

  void showMarquee(const std::string&, double offset, double progress,
                   const std::string& speedIndicator, bool) override {
    marquee.push_back(MarqueeFrame{offset, progress, speedIndicator});
  }

  void showFinished() override { ++finished; }

  int viewportWidth() const override { return width; }

  int width = 20;
  std::vector<UnitFrame> units;
  std::vector<MarqueeFrame> marquee;
  int finished = 0;
};

}  // namespace test
}  // namespace vprompter

#endif  // VPROMPTER_TEST_SUPPORT_H
