#include "hashcore/core/hash.hpp"

#include "hashcore/encoding/hex.hpp"
#include "hashcore/security/digest.hpp"

namespace hashcore::core {
    namespace {
        [[nodiscard]] std::string_view strip_hex_prefix(std::string_view hex) noexcept {
            if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
                hex.remove_prefix(2);
            }
            return hex;
        }
    } // namespace

    Status Hash::from_bytes(BufferView bytes, Hash* out) noexcept {
        if (out == nullptr || !buffer_ok(bytes)) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }
        if (bytes.len != kLength) {
            return make_status(StatusDomain::Core, StatusCode::InvalidLength, bytes.len);
        }

        Hash h;
        for (u32 i = 0; i < kLength; ++i) {
            h.b_[i] = bytes.data[i];
        }
        *out = h;
        return ok_status();
    }

    Status Hash::parse(std::string_view hex, Hash* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        const std::string_view digits = strip_hex_prefix(hex);
        if (digits.size() != kHexLength) {
            return make_status(StatusDomain::Core, StatusCode::InvalidHex, static_cast<u32>(digits.size()));
        }

        Hash h;
        u32 written = 0;
        const Status s = hashcore::encoding::hex_decode(digits, {h.b_.data(), kLength}, &written);
        if (!is_ok(s)) {
            return make_status(StatusDomain::Core, StatusCode::InvalidHex, s.aux);
        }
        if (written != kLength) {
            return make_status(StatusDomain::Core, StatusCode::InvalidHex, written * 2);
        }

        *out = h;
        return ok_status();
    }

    Status Hash::digest(BufferView data, Hash* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Core, StatusCode::Invalid);
        }

        Hash h;
        const Status s = hashcore::security::sha3_256(data, &h.b_);
        if (!is_ok(s)) {
            return s;
        }
        *out = h;
        return ok_status();
    }

    void Hash::to_hex(char* out, std::size_t out_size) const noexcept {
        if (out == nullptr || out_size == 0) {
            return;
        }
        const Status s = hashcore::encoding::hex_encode({b_.data(), kLength}, out, out_size);
        if (!is_ok(s)) {
            out[0] = '\0';
        }
    }

    std::string Hash::to_string() const {
        char hex[kHexLength + 1];
        to_hex(hex, sizeof(hex));
        return std::string(hex, kHexLength);
    }

    std::string Hash::to_short_string() const {
        char hex[kHexLength + 1];
        to_hex(hex, sizeof(hex));

        std::string out;
        out.reserve(kShortHexLength);
        out.append(hex, 6);
        out.append("...");
        out.append(hex + kHexLength - 6, 6);
        return out;
    }

    int Hash::compare(const Hash& other) const noexcept {
        for (u32 i = 0; i < kLength; ++i) {
            if (b_[i] != other.b_[i]) {
                return b_[i] < other.b_[i] ? -1 : 1;
            }
        }
        return 0;
    }

    bool Hash::equals(const Hash* other) const noexcept {
        if (other == nullptr) {
            return false;
        }
        return equals(*other);
    }

    bool Hash::equals(const Hash& other) const noexcept {
        // No early exit: every byte pair is visited whatever the first mismatch.
        u8 diff = 0;
        for (u32 i = 0; i < kLength; ++i) {
            diff |= static_cast<u8>(b_[i] ^ other.b_[i]);
        }
        return diff == 0;
    }

    bool Hash::is_zero() const noexcept {
        return equals(empty_hash());
    }

    std::string Hash::to_json() const {
        return to_string();
    }

    void Hash::append_json(std::string& doc) const {
        char hex[kHexLength + 1];
        to_hex(hex, sizeof(hex));
        doc.push_back('"');
        doc.append(hex, kHexLength);
        doc.push_back('"');
    }

    const Hash& empty_hash() noexcept {
        static const Hash kEmpty{};
        return kEmpty;
    }
} // namespace hashcore::core
