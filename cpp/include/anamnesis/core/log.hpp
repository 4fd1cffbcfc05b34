#pragma once

#include <cstdarg>

#include "anamnesis/core/types.hpp"

namespace anamnesis::core {

    enum class LogLevel : u8 {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
    };

    void log_set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;

    // "error", "warn", "info", "debug"
    [[nodiscard]] const char* log_level_name(LogLevel level) noexcept;
    [[nodiscard]] bool log_level_from_name(const char* name, LogLevel* out) noexcept;

    // Writes "[level] component: message" to stderr when level is enabled.
    void log_vwrite(LogLevel level, const char* component, const char* fmt, va_list args) noexcept
        __attribute__((format(printf, 3, 0)));

    __attribute__((format(printf, 2, 3))) inline void log_error(const char* component, const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Error, component, fmt, args);
        va_end(args);
    }

    __attribute__((format(printf, 2, 3))) inline void log_warn(const char* component, const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Warn, component, fmt, args);
        va_end(args);
    }

    __attribute__((format(printf, 2, 3))) inline void log_info(const char* component, const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Info, component, fmt, args);
        va_end(args);
    }

    __attribute__((format(printf, 2, 3))) inline void log_debug(const char* component, const char* fmt, ...) noexcept {
        va_list args;
        va_start(args, fmt);
        log_vwrite(LogLevel::Debug, component, fmt, args);
        va_end(args);
    }

} // namespace anamnesis::core
