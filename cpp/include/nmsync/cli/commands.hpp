#pragma once

#include <type_traits>

#include "nmsync/cli/options.hpp"
#include "nmsync/core/errors.hpp"

namespace nmsync::cli {
    using u32 = nmsync::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Create = 2,
        Index = 3,
        Remove = 4,
        Show = 5,
        Tags = 6,
        Tag = 7,
        UntagAll = 8,
        SyncFlags = 9,
        Upgrade = 10,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
        u32 min_args{0};
        const char* usage{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    // Matches argv[0] against specs and hands back the remaining arguments.
    // An unknown command is NotFound. Too few arguments is Invalid with
    // out->id still set, so the caller can print the usage line.
    nmsync::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    // The nmsync command table.
    const CommandSpec* default_commands(u32* count) noexcept;
    const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, CommandId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace nmsync::cli
