/*
VoicePrompter — Command channel shared by the input sources and the engine.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_COMMAND_CHANNEL_H
#define VPROMPTER_COMMAND_CHANNEL_H

#include "command.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace vprompter {

// Multi-producer, single-consumer FIFO.
//
// Commands come out in the order they were pushed. Nothing is reordered,
// dropped or merged, so each source's own order is preserved; commands from
// different sources interleave by arrival.
class CommandChannel {
public:
  // Returns false (and drops the command) once the channel is closed.
  bool push(const Command& cmd);

  // Waits up to timeout for a command. Returns nullopt on timeout, or
  // immediately when the channel is closed and empty.
  std::optional<Command> popFor(std::chrono::milliseconds timeout);

  // Non-blocking pop.
  std::optional<Command> tryPop();

  // Wakes the consumer; further pushes are refused.
  void close();

  bool closed() const;
  std::size_t size() const;

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Command> queue_;
  bool closed_ = false;
};

}  // namespace vprompter

#endif  // VPROMPTER_COMMAND_CHANNEL_H
