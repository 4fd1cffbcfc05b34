#include "anamnesis/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace anamnesis::core {
    namespace {
        std::atomic<u8> g_level{static_cast<u8>(LogLevel::Info)};
    } // namespace

    void log_set_level(LogLevel level) noexcept {
        g_level.store(static_cast<u8>(level), std::memory_order_relaxed);
    }

    LogLevel log_level() noexcept {
        return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
    }

    const char* log_level_name(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn: return "warn";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        }
        return "info";
    }

    bool log_level_from_name(const char* name, LogLevel* out) noexcept {
        if (name == nullptr || out == nullptr) {
            return false;
        }
        for (LogLevel l : {LogLevel::Error, LogLevel::Warn, LogLevel::Info, LogLevel::Debug}) {
            if (std::strcmp(log_level_name(l), name) == 0) {
                *out = l;
                return true;
            }
        }
        return false;
    }

    void log_vwrite(LogLevel level, const char* component, const char* fmt, va_list args) noexcept {
        if (static_cast<u8>(level) > g_level.load(std::memory_order_relaxed)) {
            return;
        }

        // Format into one buffer so concurrent writers never interleave within a line.
        char line[1024];
        int off = std::snprintf(line, sizeof(line), "[%s] %s: ",
                                log_level_name(level), component ? component : "anamnesis");
        if (off < 0) {
            return;
        }
        if (static_cast<size_t>(off) < sizeof(line)) {
            const int n = std::vsnprintf(line + off, sizeof(line) - static_cast<size_t>(off), fmt, args);
            if (n > 0) {
                off += n;
            }
        }
        if (static_cast<size_t>(off) >= sizeof(line) - 1) {
            off = static_cast<int>(sizeof(line) - 2);
        }
        line[off] = '\n';
        line[off + 1] = '\0';
        std::fputs(line, stderr);
    }
} // namespace anamnesis::core
