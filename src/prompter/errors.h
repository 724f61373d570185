/*
VoicePrompter — Error types shared by the prompter core.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#ifndef VPROMPTER_ERRORS_H
#define VPROMPTER_ERRORS_H

#include <stdexcept>
#include <string>

namespace vprompter {

// Fatal setup problem: missing script, unreadable settings, bad values.
// Raised before the engine starts; the tool reports it and exits non-zero.
class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// The script produced no display units.
class EmptyScriptError : public ConfigError
{
public:
    explicit EmptyScriptError(const std::string& msg) : ConfigError(msg) {}
};

// The terminal could not be switched into cbreak mode.
class TerminalError : public std::runtime_error
{
public:
    explicit TerminalError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace vprompter

#endif // VPROMPTER_ERRORS_H
