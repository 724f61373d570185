/*
VoicePrompter — ALSA capture and Vosk offline recognition.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "vosk_backend.h"

#include "phrase_gate.h"

#include "prompter/debug_log.h"
#include "prompter/session.h"

#include <alsa/asoundlib.h>
#include <vosk_api.h>

#include <cerrno>
#include <utility>
#include <vector>

namespace vprompter {

namespace {

constexpr snd_pcm_uframes_t kFramesPerPeriod = 512;

struct PcmCloser {
  void operator()(snd_pcm_t* pcm) const { if (pcm) snd_pcm_close(pcm); }
};
struct ModelFree {
  void operator()(VoskModel* m) const { if (m) vosk_model_free(m); }
};
struct RecognizerFree {
  void operator()(VoskRecognizer* r) const { if (r) vosk_recognizer_free(r); }
};

}  // namespace

std::string extractResultText(const std::string& json) {
  size_t pos = json.find("\"text\"");
  if (pos == std::string::npos) return {};
  pos = json.find(':', pos);
  if (pos == std::string::npos) return {};
  pos = json.find('"', pos);
  if (pos == std::string::npos) return {};

  std::string out;
  for (size_t i = pos + 1; i < json.size(); ++i) {
    const char c = json[i];
    if (c == '\\' && i + 1 < json.size()) {
      out.push_back(json[++i]);
      continue;
    }
    if (c == '"') break;
    out.push_back(c);
  }
  return out;
}

struct VoskBackend::Impl {
  VoskOptions options;
  std::unique_ptr<snd_pcm_t, PcmCloser> pcm;
  std::unique_ptr<VoskModel, ModelFree> model;
  std::unique_ptr<VoskRecognizer, RecognizerFree> recognizer;
  snd_pcm_uframes_t period = kFramesPerPeriod;
  unsigned int rate = 16000;

  bool openPcm(std::string& outError);
};

bool VoskBackend::Impl::openPcm(std::string& outError) {
  snd_pcm_t* handle = nullptr;
  int err = snd_pcm_open(&handle, options.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
  if (err < 0) {
    outError = "Cannot open capture device '" + options.device + "': " + snd_strerror(err);
    return false;
  }
  pcm.reset(handle);

  snd_pcm_hw_params_t* hw = nullptr;
  snd_pcm_hw_params_alloca(&hw);
  snd_pcm_hw_params_any(handle, hw);

  rate = options.sampleRate;
  period = kFramesPerPeriod;
  snd_pcm_uframes_t bufferFrames = period * 16;

  if ((err = snd_pcm_hw_params_set_access(handle, hw, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0 ||
      (err = snd_pcm_hw_params_set_format(handle, hw, SND_PCM_FORMAT_S16_LE)) < 0 ||
      (err = snd_pcm_hw_params_set_channels(handle, hw, 1)) < 0 ||
      (err = snd_pcm_hw_params_set_rate_near(handle, hw, &rate, nullptr)) < 0 ||
      (err = snd_pcm_hw_params_set_period_size_near(handle, hw, &period, nullptr)) < 0 ||
      (err = snd_pcm_hw_params_set_buffer_size_near(handle, hw, &bufferFrames)) < 0 ||
      (err = snd_pcm_hw_params(handle, hw)) < 0) {
    outError = std::string("Cannot configure capture device: ") + snd_strerror(err);
    pcm.reset();
    return false;
  }

  DEBUG_LOG("vosk: capture on '%s' at %u Hz, %lu frames/period", options.device.c_str(), rate,
            static_cast<unsigned long>(period));
  return true;
}

VoskBackend::VoskBackend(VoskOptions options) : impl_(std::make_unique<Impl>()) {
  impl_->options = std::move(options);
}

VoskBackend::~VoskBackend() = default;

bool VoskBackend::open(std::string& outError) {
  if (impl_->options.modelPath.empty()) {
    outError = "No speech model configured (use --model <dir>)";
    return false;
  }

  vosk_set_log_level(-1);
  impl_->model.reset(vosk_model_new(impl_->options.modelPath.c_str()));
  if (!impl_->model) {
    outError = "Cannot load speech model from " + impl_->options.modelPath;
    return false;
  }

  if (!impl_->openPcm(outError)) return false;

  impl_->recognizer.reset(
      vosk_recognizer_new(impl_->model.get(), static_cast<float>(impl_->rate)));
  if (!impl_->recognizer) {
    outError = "Cannot create speech recognizer";
    return false;
  }
  vosk_recognizer_set_max_alternatives(impl_->recognizer.get(), 0);
  return true;
}

CaptureResult VoskBackend::capture(const CaptureRequest& request, const StopToken& stop) {
  CaptureResult result;
  snd_pcm_t* handle = impl_->pcm.get();
  if (!handle) {
    result.status = CaptureStatus::DeviceError;
    result.error = "Capture device is not open";
    return result;
  }

  // Audio that piled up while we were transcribing belongs to nobody.
  snd_pcm_drop(handle);
  int err = snd_pcm_prepare(handle);
  if (err < 0) {
    result.status = CaptureStatus::DeviceError;
    result.error = snd_strerror(err);
    return result;
  }

  PhraseGate gate(request, impl_->options.energyThreshold, impl_->rate);
  std::vector<int16_t> buffer(impl_->period);

  while (!stop.stopRequested()) {
    const snd_pcm_sframes_t n = snd_pcm_readi(handle, buffer.data(), impl_->period);
    if (n == -EAGAIN) continue;
    if (n == -EPIPE) {
      DEBUG_LOG("vosk: overrun, recovering");
      snd_pcm_prepare(handle);
      continue;
    }
    if (n < 0) {
      const int rc = snd_pcm_recover(handle, static_cast<int>(n), 1);
      if (rc < 0) {
        result.status = CaptureStatus::DeviceError;
        result.error = snd_strerror(rc);
        return result;
      }
      continue;
    }

    switch (gate.feed(buffer.data(), static_cast<std::size_t>(n))) {
      case PhraseGate::State::TimedOut:
        result.status = CaptureStatus::Timeout;
        return result;
      case PhraseGate::State::Done:
        result.status = CaptureStatus::Ok;
        result.clip = gate.takeClip();
        return result;
      case PhraseGate::State::Waiting:
      case PhraseGate::State::Recording:
        break;
    }
  }

  result.status = CaptureStatus::Timeout;
  return result;
}

Transcription VoskBackend::transcribe(const AudioClip& clip, const std::string& locale) {
  Transcription t;
  VoskRecognizer* rec = impl_->recognizer.get();
  if (!rec) {
    t.status = TranscriptionStatus::BackendError;
    t.error = "Recognizer is not open";
    return t;
  }

  // The model decides the language; the locale is only recorded.
  DEBUG_LOG("vosk: transcribing %.2f s (%s)", clip.seconds(), locale.c_str());

  vosk_recognizer_reset(rec);
  const int rc = vosk_recognizer_accept_waveform_s(
      rec, clip.samples.data(), static_cast<int>(clip.samples.size()));
  if (rc < 0) {
    t.status = TranscriptionStatus::BackendError;
    t.error = "Recognizer rejected the audio";
    return t;
  }

  const char* json = vosk_recognizer_final_result(rec);
  t.text = extractResultText(json ? json : "");
  t.status = t.text.empty() ? TranscriptionStatus::Unrecognized : TranscriptionStatus::Ok;
  return t;
}

}  // namespace vprompter
