#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <type_traits>

namespace hashcore::core{

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    inline constexpr u32 kHashLength = 32;

    // Raw SHA3-256 output, array order is wire order
    using Digest256 = std::array<u8, kHashLength>;

    static_assert(sizeof(Digest256) == kHashLength);
    static_assert(std::is_trivially_copyable_v<Digest256>);
} // namespace hashcore::core
