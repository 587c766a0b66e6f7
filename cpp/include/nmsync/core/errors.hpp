#pragma once
#include <cstdint>
#include <type_traits>

namespace nmsync::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Conflict,
        Io,
        Unavailable,
        Engine,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Engine,
        Bindings,
        Cli,
        Config,
    };

    // For StatusDomain::Engine, aux holds the raw notmuch_status_t.
    // For StatusCode::Io, aux holds errno when known.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr bool is_engine_error(Status s) noexcept {
        return s.domain == StatusDomain::Engine && s.code == StatusCode::Engine;
    }

    const char* status_code_name(StatusCode code) noexcept;
    const char* status_domain_name(StatusDomain domain) noexcept;

    // Human-readable description. Engine errors resolve to the engine's own
    // status string; everything else to the code name.
    const char* status_message(Status s) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace nmsync::core
