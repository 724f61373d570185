/*
VoicePrompter — RAII guard for cbreak terminal input.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_TERMINAL_MODE_H
#define VPROMPTER_TERMINAL_MODE_H

#include <termios.h>

namespace vprompter {

// Puts a tty into cbreak mode (no line buffering, no echo) and restores the
// saved settings on destruction. Signals from the keyboard stay enabled.
class TerminalMode
{
public:
    // Throws TerminalError if fd is not a terminal or cannot be configured.
    explicit TerminalMode(int fd);
    ~TerminalMode();

    TerminalMode(const TerminalMode&) = delete;
    TerminalMode& operator=(const TerminalMode&) = delete;

    TerminalMode(TerminalMode&& other) noexcept;
    TerminalMode& operator=(TerminalMode&& other) noexcept;

    [[nodiscard]] int fd() const noexcept { return fd_; }
    [[nodiscard]] bool active() const noexcept { return fd_ >= 0; }

private:
    void restore() noexcept;

    int fd_ = -1;
    termios saved_{};
};

} // namespace vprompter

#endif // VPROMPTER_TERMINAL_MODE_H
