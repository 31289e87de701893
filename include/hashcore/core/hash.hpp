#pragma once

#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include "hashcore/core/buffer.hpp"
#include "hashcore/core/errors.hpp"
#include "hashcore/core/types.hpp"

namespace hashcore::core {

    // Immutable 32-byte SHA3-256 value.
    //
    // Built by from_bytes, parse or digest; each copies into the private array
    // and writes *out only on success. Accessors hand out copies, never the
    // array itself. A default-constructed Hash is the all-zero hash.
    class Hash {
    public:
        static constexpr u32 kLength = kHashLength;
        static constexpr std::size_t kHexLength = kHashLength * 2;
        static constexpr std::size_t kShortHexLength = 6 + 3 + 6;

        constexpr Hash() noexcept = default;

        // InvalidLength (aux = actual length) unless bytes.len == 32.
        [[nodiscard]] static Status from_bytes(BufferView bytes, Hash* out) noexcept;

        // 64 hex digits, optional 0x/0X prefix. InvalidHex otherwise.
        [[nodiscard]] static Status parse(std::string_view hex, Hash* out) noexcept;

        // SHA3-256 of data. Collaborator failures are returned unchanged.
        [[nodiscard]] static Status digest(BufferView data, Hash* out) noexcept;

        [[nodiscard]] Digest256 bytes() const noexcept { return b_; }

        // Lowercase hex, no prefix. Needs out_size >= kHexLength + 1.
        void to_hex(char* out, std::size_t out_size) const noexcept;
        [[nodiscard]] std::string to_string() const;

        // "abcdef...123456", for logs and display only.
        [[nodiscard]] std::string to_short_string() const;

        // Unsigned byte-wise lexicographic order: -1, 0 or 1.
        [[nodiscard]] int compare(const Hash& other) const noexcept;

        // Constant time over all 32 bytes. nullptr compares unequal.
        [[nodiscard]] bool equals(const Hash* other) const noexcept;
        [[nodiscard]] bool equals(const Hash& other) const noexcept;

        [[nodiscard]] bool is_zero() const noexcept;

        // JSON value form: to_json() is the bare hex, append_json() writes it quoted.
        [[nodiscard]] std::string to_json() const;
        void append_json(std::string& doc) const;

        friend bool operator==(const Hash& a, const Hash& b) noexcept {
            return a.equals(b);
        }

        friend std::strong_ordering operator<=>(const Hash& a, const Hash& b) noexcept {
            const int c = a.compare(b);
            if (c < 0) return std::strong_ordering::less;
            if (c > 0) return std::strong_ordering::greater;
            return std::strong_ordering::equal;
        }

    private:
        Digest256 b_{};
    };

    static_assert(sizeof(Hash) == kHashLength);
    static_assert(std::is_trivially_copyable_v<Hash>);
    static_assert(std::is_standard_layout_v<Hash>);

    // The all-zero hash. Initialized once, read-only.
    const Hash& empty_hash() noexcept;

} // namespace hashcore::core

namespace std {
    template <>
    struct hash<hashcore::core::Hash> {
        size_t operator()(const hashcore::core::Hash& h) const noexcept {
            // Digest bytes are already uniformly distributed.
            const hashcore::core::Digest256 b = h.bytes();
            size_t v = 0;
            for (size_t i = 0; i < sizeof(size_t); ++i) {
                v = (v << 8) | b[i];
            }
            return v;
        }
    };
} // namespace std
