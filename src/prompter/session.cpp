/*
VoicePrompter — State shared across the source threads and the engine.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "session.h"

#include <utility>

namespace vprompter {

void StopToken::requestStop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopped_.store(true);
  }
  cv_.notify_all();
}

bool StopToken::stopRequested() const noexcept {
  return stopped_.load();
}

bool StopToken::waitFor(std::chrono::milliseconds d) const {
  std::unique_lock<std::mutex> lock(mtx_);
  return cv_.wait_for(lock, d, [this] { return stopped_.load(); });
}

void UnitMailbox::publish(std::string unit) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    unit_ = std::move(unit);
    ++generation_;
  }
  cv_.notify_all();
}

UnitMailbox::Snapshot UnitMailbox::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return Snapshot{unit_, generation_};
}

std::uint64_t UnitMailbox::generation() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return generation_;
}

bool UnitMailbox::waitForChange(std::uint64_t since, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mtx_);
  return cv_.wait_for(lock, timeout, [&] { return generation_ != since; });
}

bool Session::toggleVoice() noexcept {
  bool current = voiceEnabled_.load();
  while (!voiceEnabled_.compare_exchange_weak(current, !current)) {
  }
  return !current;
}

}  // namespace vprompter
