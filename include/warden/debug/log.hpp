#pragma once

/**
 * @file log.hpp
 * @brief Level-gated diagnostic logging for the warden runtime.
 *
 * Lines go to stderr unless the host installs a sink. The threshold comes
 * from WARDEN_LOG_LEVEL (trace, debug, info, warn, error, off) on first use
 * and can be changed at runtime with SetLevel().
 *
 * Never pass secret bytes to these macros. Storage keys are logged by name.
 */

#include <cstdint>
#include <cstdio>
#include "warden/core/format.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace warden::debug {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

using LogSink = std::function<void(LogLevel level, std::string_view component, std::string_view line)>;

class Logger {
public:
    static bool IsEnabled(LogLevel level) noexcept;
    static void SetLevel(LogLevel level) noexcept;
    static LogLevel GetLevel() noexcept;

    /// Replaces the stderr writer. Passing an empty sink restores stderr.
    static void SetSink(LogSink sink);

    static void Write(LogLevel level, std::string_view component, std::string_view line);

    static LogLevel ParseLevel(std::string_view text, LogLevel fallback) noexcept;
    static const char* LevelToString(LogLevel level) noexcept;

    Logger() = delete;
};

// ============================================================================
// Logging macros
// ============================================================================

#define WARDEN_LOG(level, component, ...) \
    do { \
        if (::warden::debug::Logger::IsEnabled(level)) { \
            ::warden::debug::Logger::Write(level, component, ::warden::compat::format(__VA_ARGS__)); \
        } \
    } while(0)

#define WARDEN_LOG_TRACE(component, ...) WARDEN_LOG(::warden::debug::LogLevel::Trace, component, __VA_ARGS__)
#define WARDEN_LOG_DEBUG(component, ...) WARDEN_LOG(::warden::debug::LogLevel::Debug, component, __VA_ARGS__)
#define WARDEN_LOG_INFO(component, ...)  WARDEN_LOG(::warden::debug::LogLevel::Info, component, __VA_ARGS__)
#define WARDEN_LOG_WARN(component, ...)  WARDEN_LOG(::warden::debug::LogLevel::Warn, component, __VA_ARGS__)
#define WARDEN_LOG_ERROR(component, ...) WARDEN_LOG(::warden::debug::LogLevel::Error, component, __VA_ARGS__)

} // namespace warden::debug
