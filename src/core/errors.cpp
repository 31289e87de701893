#include "hashcore/core/errors.hpp"

#include <cstdio>

#include "hashcore/core/types.hpp"
#include "hashcore/security/digest.hpp"

namespace hashcore::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::InvalidLength: return "InvalidLength";
            case StatusCode::InvalidHex: return "InvalidHex";
            case StatusCode::Crypto: return "Crypto";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Encoding: return "Encoding";
            case StatusDomain::Security: return "Security";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    void status_describe(Status s, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return;
        }

        const bool bad_digit = (s.aux & kHexAuxBadDigit) != 0;
        const unsigned detail = static_cast<unsigned>(s.aux & ~kHexAuxBadDigit);

        switch (s.code) {
            case StatusCode::Ok:
                std::snprintf(out, out_size, "ok");
                return;
            case StatusCode::InvalidLength:
                std::snprintf(out, out_size, "invalid hash length: expected %u bytes, got %u",
                              static_cast<unsigned>(kHashLength),
                              static_cast<unsigned>(s.aux));
                return;
            case StatusCode::InvalidHex:
                if (s.domain == StatusDomain::Core) {
                    if (bad_digit) {
                        std::snprintf(out, out_size,
                                      "invalid hex hash: expected %u bytes, character at offset %u is not a hex digit",
                                      static_cast<unsigned>(kHashLength), detail);
                    } else {
                        std::snprintf(out, out_size,
                                      "invalid hex hash: expected %u bytes (%u hex digits), got %u hex digits",
                                      static_cast<unsigned>(kHashLength),
                                      static_cast<unsigned>(kHashLength * 2), detail);
                    }
                } else if (bad_digit) {
                    std::snprintf(out, out_size, "invalid hex: character at offset %u is not a hex digit", detail);
                } else {
                    std::snprintf(out, out_size, "invalid hex: cannot decode %u hex digits", detail);
                }
                return;
            case StatusCode::Crypto:
                if (s.domain == StatusDomain::Security) {
                    char reason[256];
                    hashcore::security::crypto_error_string(s.aux, reason, sizeof(reason));
                    std::snprintf(out, out_size, "digest computation failed: %s", reason);
                    return;
                }
                break;
            default:
                break;
        }

        std::snprintf(out, out_size, "%s failed (code=%s/%u, aux=%u)",
                      status_domain_name(s.domain),
                      status_code_name(s.code),
                      static_cast<unsigned>(s.code),
                      static_cast<unsigned>(s.aux));
    }
} // namespace hashcore::core
