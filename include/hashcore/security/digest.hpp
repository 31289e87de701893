#pragma once

#include <cstddef>

#include "hashcore/core/buffer.hpp"
#include "hashcore/core/errors.hpp"
#include "hashcore/core/types.hpp"

namespace hashcore::security {
    using u8 = hashcore::core::u8;
    using u32 = hashcore::core::u32;
    using BufferView = hashcore::core::BufferView;
    using Digest256 = hashcore::core::Digest256;

    // One-shot SHA3-256 over data. Reentrant: every call owns its own EVP context.
    // Failures are Security/Crypto with the OpenSSL error code in aux.
    hashcore::core::Status sha3_256(BufferView data, Digest256* out) noexcept;

    // Renders an OpenSSL error code (Status::aux of a Security/Crypto status).
    void crypto_error_string(u32 code, char* out, std::size_t out_size) noexcept;

} // namespace hashcore::security
