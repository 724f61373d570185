/*
VoicePrompter — Debug logging to a file.
Copyright 2025-2026 Tamas Geczy.
Licensed under the MIT License. See LICENSE for details.
*/

#include "debug_log.h"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace DebugLog {

namespace {

std::atomic<bool>& enabled_flag()
{
    // Default OFF. Users opt in with --log or logging.enabled.
    static std::atomic<bool> enabled{false};
    return enabled;
}

// Guards the path and serializes writes from the source threads.
std::mutex& log_mutex()
{
    static std::mutex m;
    return m;
}

std::string& configured_path()
{
    static std::string path;
    return path;
}

std::string default_log_path()
{
    const char* tmp = std::getenv("TMPDIR");
    std::string dir = (tmp && *tmp) ? tmp : "/tmp";
    if (dir.back() != '/') {
        dir += '/';
    }
    return dir + "voicePrompter_debug.log";
}

void truncate_if_too_large(const std::string& path)
{
    // Keep the log size bounded if a user turns logging on and forgets about it.
    constexpr std::uintmax_t kMaxBytes = 1024u * 1024u; // 1 MiB

    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec || size <= kMaxBytes) {
        return;
    }

    if (FILE* f = std::fopen(path.c_str(), "w")) {
        std::fclose(f);
    }
}

} // namespace

void SetEnabled(bool enabled)
{
    enabled_flag().store(enabled, std::memory_order_relaxed);
}

bool IsEnabled()
{
    return enabled_flag().load(std::memory_order_relaxed);
}

void SetPath(const std::string& path)
{
    std::lock_guard<std::mutex> lock(log_mutex());
    configured_path() = path;
}

std::string GetLogPath()
{
    std::lock_guard<std::mutex> lock(log_mutex());
    return configured_path().empty() ? default_log_path() : configured_path();
}

void Log(const char* fmt, ...)
{
    if (!IsEnabled()) {
        return;
    }

    const std::string path = GetLogPath();

    std::lock_guard<std::mutex> lock(log_mutex());
    truncate_if_too_large(path);
    FILE* f = std::fopen(path.c_str(), "a");
    if (!f) {
        return;
    }

    const std::time_t now = std::time(nullptr);
    std::tm st{};
    localtime_r(&now, &st);

    std::fprintf(f,
                 "[%04d-%02d-%02d %02d:%02d:%02d] ",
                 st.tm_year + 1900,
                 st.tm_mon + 1,
                 st.tm_mday,
                 st.tm_hour,
                 st.tm_min,
                 st.tm_sec);

    va_list args;
    va_start(args, fmt);
    std::vfprintf(f, fmt, args);
    va_end(args);

    std::fprintf(f, "\n");
    std::fclose(f);
}

void ClearLog()
{
    if (!IsEnabled()) {
        return;
    }

    const std::string path = GetLogPath();
    std::lock_guard<std::mutex> lock(log_mutex());
    if (FILE* f = std::fopen(path.c_str(), "w")) {
        std::fclose(f);
    }
}

} // namespace DebugLog
