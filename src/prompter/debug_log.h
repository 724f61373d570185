/*
VoicePrompter — Debug logging to a file.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#pragma once

// Compile-time enable/disable (CMake option VPROMPTER_ENABLE_DEBUG_LOG).
// When compiled in, logging is still off until DebugLog::SetEnabled(true).
#ifndef ENABLE_DEBUG_LOG
#define ENABLE_DEBUG_LOG 1
#endif

#include <string>

namespace DebugLog {

// The terminal belongs to the prompter UI, so the log always goes to a file.
void SetEnabled(bool enabled);
bool IsEnabled();

// Empty path => $TMPDIR/voicePrompter_debug.log (or /tmp).
void SetPath(const std::string& path);
std::string GetLogPath();

#if defined(__GNUC__)
__attribute__((format(printf, 1, 2)))
#endif
void Log(const char* fmt, ...);

void ClearLog();

} // namespace DebugLog

#if ENABLE_DEBUG_LOG
#define DEBUG_LOG(...) DebugLog::Log(__VA_ARGS__)
#else
#define DEBUG_LOG(...) (void)0
#endif
