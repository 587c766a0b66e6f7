#pragma once

#include <string>

#include "nmsync/cli/options.hpp"
#include "nmsync/core/errors.hpp"
#include "nmsync/core/log.hpp"

namespace nmsync::cli {

    inline constexpr const char* kDatabaseEnv = "NMSYNC_DATABASE";

    // Mail root used when neither --database nor NMSYNC_DATABASE is given,
    // relative to $HOME.
    inline constexpr const char* kDefaultMailDir = "mail";

    struct CliConfig {
        std::string database_path;
        bool read_only{false};
        bool help{false};
        nmsync::core::LogLevel log_level{nmsync::core::LogLevel::Warn};
    };

    // The global options nmsync accepts before its command.
    const OptionSpec* default_options(u32* count) noexcept;

    // Builds the configuration from, in increasing precedence: built-in
    // defaults, the environment (NMSYNC_DATABASE, NMSYNC_LOG_LEVEL, HOME),
    // and parsed command-line options. An unrecognized NMSYNC_LOG_LEVEL is
    // ignored; an unrecognized --log-level is {Config, Invalid}.
    [[nodiscard]] nmsync::core::Status resolve_config(const ParsedOptions& opts, CliConfig* out) noexcept;

} // namespace nmsync::cli
