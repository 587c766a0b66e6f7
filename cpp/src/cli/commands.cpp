#include "nmsync/cli/commands.hpp"

#include <cstring>

namespace nmsync::cli {
    namespace {
        constexpr CommandSpec kCommands[] = {
            {CommandId::Help, "help", 0, "help"},
            {CommandId::Create, "create", 0, "create"},
            {CommandId::Index, "index", 1, "index <file>..."},
            {CommandId::Remove, "remove", 1, "remove <file>..."},
            {CommandId::Show, "show", 1, "show <message-id>"},
            {CommandId::Tags, "tags", 1, "tags <message-id>"},
            {CommandId::Tag, "tag", 2, "tag <message-id> +tag|-tag..."},
            {CommandId::UntagAll, "untag-all", 1, "untag-all <message-id>"},
            {CommandId::SyncFlags, "sync-flags", 1, "sync-flags <message-id>"},
            {CommandId::Upgrade, "upgrade", 0, "upgrade"},
        };
    } // namespace

    const CommandSpec* default_commands(u32* count) noexcept {
        if (count != nullptr) {
            *count = static_cast<u32>(sizeof(kCommands) / sizeof(kCommands[0]));
        }
        return kCommands;
    }

    const CommandSpec* find_command(const CommandSpec* specs, u32 spec_count, CommandId id) noexcept {
        if (specs == nullptr) {
            return nullptr;
        }
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].id == id) {
                return &specs[i];
            }
        }
        return nullptr;
    }

    nmsync::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return nmsync::core::make_status(nmsync::core::StatusDomain::Cli, nmsync::core::StatusCode::Invalid);
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return nmsync::core::make_status(nmsync::core::StatusDomain::Cli, nmsync::core::StatusCode::Invalid);
        }
        if (spec_count > 0 && specs == nullptr) {
            return nmsync::core::make_status(nmsync::core::StatusDomain::Cli, nmsync::core::StatusCode::Invalid);
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return nmsync::core::make_status(nmsync::core::StatusDomain::Cli, nmsync::core::StatusCode::Invalid);
        }

        const CommandSpec* match = nullptr;
        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                match = &specs[i];
                break;
            }
        }
        if (match == nullptr) {
            return nmsync::core::make_status(nmsync::core::StatusDomain::Cli, nmsync::core::StatusCode::NotFound);
        }

        out->id = match->id;
        out->args.argv = args.argv + 1;
        out->args.argc = args.argc - 1;
        *consumed = 1;
        if (out->args.argc < match->min_args) {
            return nmsync::core::make_status(nmsync::core::StatusDomain::Cli, nmsync::core::StatusCode::Invalid);
        }
        return nmsync::core::ok_status();
    }
} // namespace nmsync::cli
