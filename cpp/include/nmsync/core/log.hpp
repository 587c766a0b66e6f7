#pragma once

#include "nmsync/core/errors.hpp"
#include "nmsync/core/types.hpp"

namespace nmsync::core {

    enum class LogLevel : u8 {
        Error = 0,
        Warn = 1,
        Info = 2,
        Debug = 3,
    };

    inline constexpr const char* kLogLevelEnv = "NMSYNC_LOG_LEVEL";

    void set_log_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel log_level() noexcept;
    [[nodiscard]] bool log_enabled(LogLevel level) noexcept;

    // Accepts "error", "warn", "info", "debug" (case-insensitive).
    [[nodiscard]] Status parse_log_level(const char* name, LogLevel* out) noexcept;

    // Applies NMSYNC_LOG_LEVEL if set and valid. Unset leaves the level alone.
    [[nodiscard]] Status log_level_from_env() noexcept;

    // printf-style lines on stderr, prefixed with the level name.
    void log_error(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_warn(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_info(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));
    void log_debug(const char* fmt, ...) noexcept __attribute__((format(printf, 1, 2)));

    // "error: <context> failed (code=Engine/7, domain=Engine/1, aux=5): <message>"
    void log_status_error(const char* context, Status s) noexcept;

} // namespace nmsync::core
