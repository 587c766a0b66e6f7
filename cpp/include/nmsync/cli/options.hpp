#pragma once

#include <type_traits>

#include "nmsync/core/errors.hpp"
#include "nmsync/core/types.hpp"

namespace nmsync::cli {
    using u8 = nmsync::core::u8;
    using u32 = nmsync::core::u32;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
    };

    enum class OptionId : u32 {
        None = 0,
        Database = 1,
        ReadOnly = 2,
        LogLevel = 3,
        Help = 4,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    union OptionValue {
        const char* str;
        u8 boolv;
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        OptionValue value{};
    };

    // Caller-provided storage; parse_options fails with Invalid when full.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Parses leading options ("--name value", "--name=value", "-n value",
    // "-nvalue", flags) and stops at the first non-option or after "--".
    // *consumed is the number of argv entries taken.
    nmsync::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace nmsync::cli
