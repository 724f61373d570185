/*
VoicePrompter — Command channel shared by the input sources and the engine.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "command_channel.h"

#include <utility>

namespace vprompter {

bool CommandChannel::push(const Command& cmd) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return false;
    queue_.push_back(cmd);
  }
  cv_.notify_one();
  return true;
}

std::optional<Command> CommandChannel::popFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
  if (queue_.empty()) return std::nullopt;

  Command cmd = std::move(queue_.front());
  queue_.pop_front();
  return cmd;
}

std::optional<Command> CommandChannel::tryPop() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (queue_.empty()) return std::nullopt;

  Command cmd = std::move(queue_.front());
  queue_.pop_front();
  return cmd;
}

void CommandChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool CommandChannel::closed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closed_;
}

std::size_t CommandChannel::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}

const char* commandTypeName(CommandType type) {
  switch (type) {
    case CommandType::Next: return "Next";
    case CommandType::Previous: return "Previous";
    case CommandType::Quit: return "Quit";
    case CommandType::ToggleVoice: return "ToggleVoice";
    case CommandType::SetSpeed: return "SetSpeed";
    case CommandType::TogglePause: return "TogglePause";
  }
  return "?";
}

const char* commandSourceName(CommandSource source) {
  switch (source) {
    case CommandSource::Keyboard: return "keyboard";
    case CommandSource::Voice: return "voice";
    case CommandSource::System: return "system";
  }
  return "?";
}

}  // namespace vprompter
