#include "nmsync/cli/config.hpp"

#include <cstdlib>
#include <new>

namespace nmsync::cli {

using namespace nmsync::core;

namespace {
    constexpr OptionSpec kOptions[] = {
        {OptionId::Database, OptionType::String, "database", 'd'},
        {OptionId::ReadOnly, OptionType::Flag, "read-only", 'r'},
        {OptionId::LogLevel, OptionType::String, "log-level", 'l'},
        {OptionId::Help, OptionType::Flag, "help", 'h'},
    };

    [[nodiscard]] bool non_empty(const char* s) noexcept {
        return s != nullptr && s[0] != '\0';
    }
} // namespace

const OptionSpec* default_options(u32* count) noexcept {
    if (count != nullptr) {
        *count = static_cast<u32>(sizeof(kOptions) / sizeof(kOptions[0]));
    }
    return kOptions;
}

Status resolve_config(const ParsedOptions& opts, CliConfig* out) noexcept {
    if (out == nullptr || (opts.len > 0 && opts.data == nullptr)) {
        return make_status(StatusDomain::Config, StatusCode::Invalid);
    }
    *out = CliConfig{};

    bool level_given = false;
    for (u32 i = 0; i < opts.len; ++i) {
        if (opts.data[i].id == OptionId::LogLevel) {
            level_given = true;
        }
    }

    // An unparseable NMSYNC_LOG_LEVEL is ignored, keeping the default.
    const char* env_level = std::getenv(kLogLevelEnv);
    if (!level_given && non_empty(env_level)) {
        LogLevel level{};
        if (is_ok(parse_log_level(env_level, &level))) {
            out->log_level = level;
        }
    }

    try {
        const char* env_db = std::getenv(kDatabaseEnv);
        if (non_empty(env_db)) {
            out->database_path = env_db;
        } else {
            const char* home = std::getenv("HOME");
            if (non_empty(home)) {
                out->database_path = home;
                out->database_path += '/';
                out->database_path += kDefaultMailDir;
            }
        }

        for (u32 i = 0; i < opts.len; ++i) {
            const ParsedOption& opt = opts.data[i];
            switch (opt.id) {
                case OptionId::Database:
                    if (!non_empty(opt.value.str)) {
                        return make_status(StatusDomain::Config, StatusCode::Invalid);
                    }
                    out->database_path = opt.value.str;
                    break;
                case OptionId::ReadOnly:
                    out->read_only = true;
                    break;
                case OptionId::LogLevel: {
                    Status s = parse_log_level(opt.value.str, &out->log_level);
                    if (!is_ok(s)) {
                        return s;
                    }
                    break;
                }
                case OptionId::Help:
                    out->help = true;
                    break;
                case OptionId::None:
                    break;
            }
        }
    } catch (const std::bad_alloc&) {
        return make_status(StatusDomain::Config, StatusCode::Unknown);
    }

    if (out->database_path.empty() && !out->help) {
        return make_status(StatusDomain::Config, StatusCode::NotFound);
    }
    return ok_status();
}

} // namespace nmsync::cli
