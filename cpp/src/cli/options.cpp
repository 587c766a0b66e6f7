#include "nmsync/cli/options.hpp"

#include <cstring>

namespace nmsync::cli {
    namespace {
        [[nodiscard]] nmsync::core::Status invalid() noexcept {
            return nmsync::core::make_status(nmsync::core::StatusDomain::Cli, nmsync::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count,
                                                  const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            if (c == '\0') {
                return nullptr;
            }
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] nmsync::core::Status push_option(ParsedOptions* out, const ParsedOption& opt) noexcept {
            if (out->cap == 0 || out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = opt;
            return nmsync::core::ok_status();
        }

        // Resolves the value of a String option: the inline part if present,
        // else the next argv entry. Advances *i past what was used.
        [[nodiscard]] const char* take_value(const CliArgs& args, const char* inline_value, u32* i) noexcept {
            if (inline_value != nullptr) {
                ++*i;
                return inline_value;
            }
            if (*i + 1 >= args.argc || args.argv[*i + 1] == nullptr) {
                return nullptr;
            }
            const char* value = args.argv[*i + 1];
            *i += 2;
            return value;
        }
    } // namespace

    nmsync::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* inline_value = nullptr;
            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = eq ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (eq != nullptr) {
                    inline_value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (tok[2] != '\0') {
                    inline_value = tok + 2;
                }
            }
            if (spec == nullptr) {
                return invalid();
            }

            ParsedOption opt{};
            opt.id = spec->id;
            opt.type = spec->type;
            if (spec->type == OptionType::Flag) {
                if (inline_value != nullptr) {
                    return invalid();
                }
                opt.value.boolv = 1;
                ++i;
            } else {
                const char* value = take_value(args, inline_value, &i);
                if (value == nullptr) {
                    return invalid();
                }
                opt.value.str = value;
            }

            const nmsync::core::Status s = push_option(out, opt);
            if (!nmsync::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return nmsync::core::ok_status();
    }
} // namespace nmsync::cli
