#include "nmsync/core/log.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <strings.h>

namespace nmsync::core {

namespace {
    std::atomic<u8> g_log_level{static_cast<u8>(LogLevel::Warn)};

    const char* level_prefix(LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Error: return "error";
            case LogLevel::Warn: return "warning";
            case LogLevel::Info: return "info";
            case LogLevel::Debug: return "debug";
        }
        return "log";
    }

    void vlog(LogLevel level, const char* fmt, va_list args) noexcept {
        if (!log_enabled(level)) {
            return;
        }
        std::fprintf(stderr, "%s: ", level_prefix(level));
        std::vfprintf(stderr, fmt, args);
        std::fputc('\n', stderr);
    }
} // namespace

void set_log_level(LogLevel level) noexcept {
    g_log_level.store(static_cast<u8>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel level) noexcept {
    return static_cast<u8>(level) <= g_log_level.load(std::memory_order_relaxed);
}

Status parse_log_level(const char* name, LogLevel* out) noexcept {
    if (name == nullptr || out == nullptr) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }
    if (strcasecmp(name, "error") == 0) {
        *out = LogLevel::Error;
    } else if (strcasecmp(name, "warn") == 0 || strcasecmp(name, "warning") == 0) {
        *out = LogLevel::Warn;
    } else if (strcasecmp(name, "info") == 0) {
        *out = LogLevel::Info;
    } else if (strcasecmp(name, "debug") == 0) {
        *out = LogLevel::Debug;
    } else {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }
    return ok_status();
}

Status log_level_from_env() noexcept {
    const char* value = std::getenv(kLogLevelEnv);
    if (value == nullptr || value[0] == '\0') {
        return ok_status();
    }
    LogLevel level{};
    const Status s = parse_log_level(value, &level);
    if (!is_ok(s)) {
        return s;
    }
    set_log_level(level);
    return ok_status();
}

void log_error(const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Error, fmt, args);
    va_end(args);
}

void log_warn(const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Warn, fmt, args);
    va_end(args);
}

void log_info(const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Info, fmt, args);
    va_end(args);
}

void log_debug(const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    vlog(LogLevel::Debug, fmt, args);
    va_end(args);
}

void log_status_error(const char* context, Status s) noexcept {
    log_error("%s failed (code=%s/%u, domain=%s/%u, aux=%u): %s",
              context,
              status_code_name(s.code),
              static_cast<unsigned>(s.code),
              status_domain_name(s.domain),
              static_cast<unsigned>(s.domain),
              s.aux,
              status_message(s));
    if (s.code == StatusCode::Io && s.aux != 0) {
        log_error("%s: %s", context, std::strerror(static_cast<int>(s.aux)));
    }
}

} // namespace nmsync::core
