/*
VoicePrompter — RAII guard for cbreak terminal input.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "terminal_mode.h"

#include "prompter/errors.h"

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace vprompter {

TerminalMode::TerminalMode(int fd)
{
    if (!isatty(fd)) {
        throw TerminalError("Input is not a terminal");
    }
    if (tcgetattr(fd, &saved_) != 0) {
        throw TerminalError(std::string("Unable to read terminal settings: ") + std::strerror(errno));
    }

    termios raw = saved_;
    raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(fd, TCSADRAIN, &raw) != 0) {
        throw TerminalError(std::string("Unable to switch terminal to cbreak mode: ") + std::strerror(errno));
    }
    fd_ = fd;
}

TerminalMode::~TerminalMode()
{
    restore();
}

TerminalMode::TerminalMode(TerminalMode&& other) noexcept
    : fd_(other.fd_), saved_(other.saved_)
{
    other.fd_ = -1;
}

TerminalMode& TerminalMode::operator=(TerminalMode&& other) noexcept
{
    if (this != &other) {
        restore();
        fd_ = other.fd_;
        saved_ = other.saved_;
        other.fd_ = -1;
    }
    return *this;
}

void TerminalMode::restore() noexcept
{
    if (fd_ >= 0) {
        // Nothing useful can be done if this fails while unwinding.
        (void)tcsetattr(fd_, TCSADRAIN, &saved_);
        fd_ = -1;
    }
}

} // namespace vprompter
