/*
VoicePrompter — Keyboard input source.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "keyboard_source.h"

#include "terminal_mode.h"

#include "prompter/debug_log.h"
#include "prompter/errors.h"

#include <cerrno>
#include <cstring>
#include <optional>

#include <poll.h>

namespace vprompter {

KeyboardSource::KeyboardSource(Session& session, CommandChannel& channel, KeyMap keyMap,
                               KeyboardOptions options)
    : session_(session), channel_(channel), decoder_(keyMap), options_(options) {}

void KeyboardSource::run() {
  std::optional<TerminalMode> mode;
  if (options_.rawMode) {
    try {
      mode.emplace(options_.fd);
    } catch (const TerminalError& e) {
      // Voice and signals keep working without a keyboard.
      DEBUG_LOG("keyboard: %s, keyboard input disabled", e.what());
      return;
    }
  }
  loop();
}

void KeyboardSource::loop() {
  const int timeoutMs = static_cast<int>(options_.pollInterval.count());
  unsigned char buf[64];

  while (!session_.stop.stopRequested()) {
    pollfd pfd{};
    pfd.fd = options_.fd;
    pfd.events = POLLIN;

    const int ret = poll(&pfd, 1, timeoutMs);
    if (ret < 0) {
      if (errno == EINTR) continue;
      DEBUG_LOG("keyboard: poll failed: %s", std::strerror(errno));
      return;
    }
    if (ret == 0) {
      decoder_.timeout();
      continue;
    }
    if (pfd.revents & POLLNVAL) {
      DEBUG_LOG("keyboard: input descriptor closed");
      return;
    }

    const ssize_t n = read(options_.fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      DEBUG_LOG("keyboard: read failed: %s", std::strerror(errno));
      return;
    }
    if (n == 0) {
      DEBUG_LOG("keyboard: end of input");
      return;
    }

    const auto now = Command::Clock::now();
    for (ssize_t i = 0; i < n; ++i) {
      if (auto cmd = decoder_.feed(buf[i], now)) {
        if (!channel_.push(*cmd)) return;
        ++emitted_;
      }
    }
  }
}

}  // namespace vprompter
