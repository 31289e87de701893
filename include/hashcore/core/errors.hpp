#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace hashcore::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        InvalidLength,
        InvalidHex,
        Crypto,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Encoding,
        Security,
        External,
    };

    // aux carries a code-specific detail:
    //   InvalidLength  actual byte length
    //   InvalidHex     hex digit count, or kHexAuxBadDigit | offset
    //   Crypto         OpenSSL error code
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    inline constexpr u32 kHexAuxBadDigit = 0x80000000u;

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    const char* status_code_name(StatusCode code) noexcept;
    const char* status_domain_name(StatusDomain domain) noexcept;

    // Writes a NUL-terminated, human-readable message for s. Truncates to out_size.
    void status_describe(Status s, char* out, std::size_t out_size) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace hashcore::core
