#pragma once

#include "nmsync/core/errors.hpp"
#include "nmsync/core/types.hpp"

namespace nmsync::engine {
    using u32 = nmsync::core::u32;

    // Raw engine status values this layer interprets per call site.
    // They mirror notmuch_status_t and are checked against it at compile time
    // in status.cpp.
    inline constexpr u32 kEngineSuccess = 0;
    inline constexpr u32 kEngineDuplicateMessageId = 6;

    // Status{Engine, Engine, raw}. Never Ok, even for raw == kEngineSuccess.
    [[nodiscard]] constexpr nmsync::core::Status engine_error(u32 raw) noexcept {
        return nmsync::core::make_status(nmsync::core::StatusDomain::Engine,
                                         nmsync::core::StatusCode::Engine,
                                         raw);
    }

    // Plain success maps to ok_status(); every other value is an engine error.
    // No value is collapsed here: callers that treat the duplicate-id status
    // as a result must test for it before calling this.
    [[nodiscard]] constexpr nmsync::core::Status from_engine(u32 raw) noexcept {
        return raw == kEngineSuccess ? nmsync::core::ok_status() : engine_error(raw);
    }

    [[nodiscard]] constexpr bool engine_status_is(nmsync::core::Status s, u32 raw) noexcept {
        return nmsync::core::is_engine_error(s) && s.aux == raw;
    }

} // namespace nmsync::engine
