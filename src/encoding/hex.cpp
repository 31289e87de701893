#include "hashcore/encoding/hex.hpp"

namespace hashcore::encoding {
    namespace {
        constexpr char kHexChars[] = "0123456789abcdef";

        [[nodiscard]] u8 nibble(char c) noexcept {
            if (c >= '0' && c <= '9') return static_cast<u8>(c - '0');
            if (c >= 'a' && c <= 'f') return static_cast<u8>(c - 'a' + 10);
            return static_cast<u8>(c - 'A' + 10);
        }

        [[nodiscard]] hashcore::core::Status hex_error(u32 aux) noexcept {
            return hashcore::core::make_status(hashcore::core::StatusDomain::Encoding,
                                               hashcore::core::StatusCode::InvalidHex, aux);
        }
    } // namespace

    hashcore::core::Status hex_encode(BufferView bytes, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || !hashcore::core::buffer_ok(bytes)) {
            return hashcore::core::make_status(hashcore::core::StatusDomain::Encoding, hashcore::core::StatusCode::Invalid);
        }
        if (out_size < static_cast<std::size_t>(bytes.len) * 2 + 1) {
            return hashcore::core::make_status(hashcore::core::StatusDomain::Encoding, hashcore::core::StatusCode::Invalid);
        }

        std::size_t pos = 0;
        for (u32 i = 0; i < bytes.len; ++i) {
            out[pos++] = kHexChars[(bytes.data[i] >> 4) & 0xF];
            out[pos++] = kHexChars[bytes.data[i] & 0xF];
        }
        out[pos] = '\0';
        return hashcore::core::ok_status();
    }

    hashcore::core::Status hex_decode(std::string_view text, BufferMut out, u32* written) noexcept {
        if (written == nullptr || !hashcore::core::buffer_ok(out)) {
            return hashcore::core::make_status(hashcore::core::StatusDomain::Encoding, hashcore::core::StatusCode::Invalid);
        }

        const u32 digits = static_cast<u32>(text.size());
        if ((digits & 1u) != 0 || text.size() / 2 > out.len) {
            return hex_error(digits);
        }

        // Validate everything before touching out.
        for (u32 i = 0; i < digits; ++i) {
            if (!hex_is_digit(text[i])) {
                return hex_error(hashcore::core::kHexAuxBadDigit | i);
            }
        }

        const u32 n = digits / 2;
        for (u32 i = 0; i < n; ++i) {
            out.data[i] = static_cast<u8>((nibble(text[i * 2]) << 4) | nibble(text[i * 2 + 1]));
        }
        *written = n;
        return hashcore::core::ok_status();
    }
} // namespace hashcore::encoding
