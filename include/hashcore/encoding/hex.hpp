#pragma once

#include <cstddef>
#include <string_view>

#include "hashcore/core/buffer.hpp"
#include "hashcore/core/errors.hpp"

namespace hashcore::encoding {
    using u8 = hashcore::core::u8;
    using u32 = hashcore::core::u32;
    using BufferView = hashcore::core::BufferView;
    using BufferMut = hashcore::core::BufferMut;

    [[nodiscard]] constexpr bool hex_is_digit(char c) noexcept {
        return (c >= '0' && c <= '9') ||
               (c >= 'a' && c <= 'f') ||
               (c >= 'A' && c <= 'F');
    }

    // Lowercase, NUL-terminated. out_size must be at least 2 * bytes.len + 1.
    hashcore::core::Status hex_encode(BufferView bytes, char* out, std::size_t out_size) noexcept;

    // Accepts either case, no prefix. On failure nothing is written to out.
    hashcore::core::Status hex_decode(std::string_view text, BufferMut out, u32* written) noexcept;

} // namespace hashcore::encoding
