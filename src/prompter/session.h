/*
VoicePrompter — State shared across the source threads and the engine.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_SESSION_H
#define VPROMPTER_SESSION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace vprompter {

/**
 * One-shot cancellation flag.
 * Set once (Quit, completion, signal or a fatal worker error), never cleared.
 */
class StopToken {
public:
  void requestStop();
  bool stopRequested() const noexcept;

  // Sleeps up to d. Returns true if a stop was requested (possibly while
  // sleeping), so loops can use it as an interruptible backoff.
  bool waitFor(std::chrono::milliseconds d) const;

private:
  std::atomic<bool> stopped_{false};
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
};

/**
 * Single-slot handoff of the unit the speaker is expected to read.
 * A publish replaces the previous unit; readers always see the latest one.
 * The generation counter lets a reader tell whether the cursor moved while
 * it was busy.
 */
class UnitMailbox {
public:
  struct Snapshot {
    std::string unit;
    std::uint64_t generation = 0;
  };

  void publish(std::string unit);
  Snapshot snapshot() const;
  std::uint64_t generation() const;

  // Waits up to timeout for a publish after `since`. Returns true if one
  // happened.
  bool waitForChange(std::uint64_t since, std::chrono::milliseconds timeout) const;

private:
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  std::string unit_;
  std::uint64_t generation_ = 0;
};

// Everything the engine and the sources share. No other state crosses
// thread boundaries; commands travel through the CommandChannel.
class Session {
public:
  StopToken stop;
  UnitMailbox expected;

  // VoiceEnabled is what the speaker toggles with 'v'.
  bool voiceEnabled() const noexcept { return voiceEnabled_.load(); }
  void setVoiceEnabled(bool on) noexcept { voiceEnabled_.store(on); }
  // Flips the flag and returns the new value.
  bool toggleVoice() noexcept;

  // False when there is no working microphone; the speaker cannot turn
  // voice on in that case.
  bool voiceAvailable() const noexcept { return voiceAvailable_.load(); }
  void setVoiceAvailable(bool on) noexcept { voiceAvailable_.store(on); }

  bool voiceActive() const noexcept { return voiceEnabled() && voiceAvailable(); }

private:
  std::atomic<bool> voiceEnabled_{false};
  std::atomic<bool> voiceAvailable_{false};
};

}  // namespace vprompter

#endif  // VPROMPTER_SESSION_H
