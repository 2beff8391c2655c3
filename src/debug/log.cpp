#include "warden/debug/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <mutex>

namespace warden::debug {

namespace {

    constexpr uint8_t LEVEL_UNSET = 0xFF;
    constexpr auto DEFAULT_LEVEL = LogLevel::Warn;

    std::atomic<uint8_t> g_level{LEVEL_UNSET};
    std::mutex g_sink_lock;
    LogSink g_sink;

    LogLevel LevelFromEnvironment() {
        const char* value = std::getenv("WARDEN_LOG_LEVEL");
        if (value == nullptr) {
            return DEFAULT_LEVEL;
        }
        return Logger::ParseLevel(value, DEFAULT_LEVEL);
    }

    LogLevel CurrentLevel() noexcept {
        uint8_t raw = g_level.load(std::memory_order_acquire);
        if (raw == LEVEL_UNSET) {
            const auto resolved = static_cast<uint8_t>(LevelFromEnvironment());
            uint8_t expected = LEVEL_UNSET;
            g_level.compare_exchange_strong(expected, resolved, std::memory_order_acq_rel);
            raw = g_level.load(std::memory_order_acquire);
        }
        return static_cast<LogLevel>(raw);
    }

} // anonymous namespace

bool Logger::IsEnabled(const LogLevel level) noexcept {
    return level != LogLevel::Off && level >= CurrentLevel();
}

void Logger::SetLevel(const LogLevel level) noexcept {
    g_level.store(static_cast<uint8_t>(level), std::memory_order_release);
}

LogLevel Logger::GetLevel() noexcept {
    return CurrentLevel();
}

void Logger::SetSink(LogSink sink) {
    std::lock_guard guard(g_sink_lock);
    g_sink = std::move(sink);
}

void Logger::Write(const LogLevel level, const std::string_view component, const std::string_view line) {
    LogSink sink;
    {
        std::lock_guard guard(g_sink_lock);
        sink = g_sink;
    }
    if (sink) {
        sink(level, component, line);
        return;
    }
    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fprintf(stderr, "[WARDEN] %lld %-5s [%.*s] %.*s\n",
        static_cast<long long>(now_ms),
        LevelToString(level),
        static_cast<int>(component.size()), component.data(),
        static_cast<int>(line.size()), line.data());
    fflush(stderr);
}

LogLevel Logger::ParseLevel(const std::string_view text, const LogLevel fallback) noexcept {
    if (text == "trace") return LogLevel::Trace;
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warn;
    if (text == "error") return LogLevel::Error;
    if (text == "off" || text == "none") return LogLevel::Off;
    return fallback;
}

const char* Logger::LevelToString(const LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "UNKNOWN";
}

} // namespace warden::debug
