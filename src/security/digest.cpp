#include "hashcore/security/digest.hpp"

#include <cstdio>

#include <openssl/err.h>
#include <openssl/evp.h>

namespace hashcore::security {
    namespace {
        [[nodiscard]] hashcore::core::Status crypto_failure() noexcept {
            const unsigned long err = ERR_get_error();
            ERR_clear_error();
            return hashcore::core::make_status(hashcore::core::StatusDomain::Security,
                                               hashcore::core::StatusCode::Crypto,
                                               static_cast<u32>(err));
        }
    } // namespace

    hashcore::core::Status sha3_256(BufferView data, Digest256* out) noexcept {
        if (out == nullptr || !hashcore::core::buffer_ok(data)) {
            return hashcore::core::make_status(hashcore::core::StatusDomain::Security, hashcore::core::StatusCode::Invalid);
        }

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            return hashcore::core::make_status(hashcore::core::StatusDomain::Security, hashcore::core::StatusCode::Unavailable);
        }

        Digest256 md{};
        unsigned int md_len = 0;

        int ok = EVP_DigestInit_ex(ctx, EVP_sha3_256(), nullptr);
        if (ok && data.len > 0) {
            ok = EVP_DigestUpdate(ctx, data.data, static_cast<size_t>(data.len));
        }
        if (ok) {
            ok = EVP_DigestFinal_ex(ctx, md.data(), &md_len);
        }
        EVP_MD_CTX_free(ctx);

        if (!ok) {
            return crypto_failure();
        }
        if (md_len != md.size()) {
            return hashcore::core::make_status(hashcore::core::StatusDomain::Security, hashcore::core::StatusCode::Crypto);
        }

        *out = md;
        return hashcore::core::ok_status();
    }

    void crypto_error_string(u32 code, char* out, std::size_t out_size) noexcept {
        if (out == nullptr || out_size == 0) {
            return;
        }
        if (code == 0) {
            std::snprintf(out, out_size, "no OpenSSL error recorded");
            return;
        }
        ERR_error_string_n(static_cast<unsigned long>(code), out, out_size);
    }
} // namespace hashcore::security
