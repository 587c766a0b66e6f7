#pragma once

#include <cstdint>
#include <cstddef>

namespace nmsync::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Seconds since the Unix epoch, as the engine reports message dates.
    using Timestamp = i64;

} // namespace nmsync::core
