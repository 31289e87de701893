#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "hashcore/encoding/hex.hpp"
#include "hashcore/security/digest.hpp"

using hashcore::core::StatusCode;
using hashcore::core::StatusDomain;
using hashcore::security::Digest256;
using hashcore::security::u32;
using hashcore::security::u8;

namespace {
static std::string sha3_hex(const std::string& input) {
    Digest256 out{};
    const auto s = hashcore::security::sha3_256(
        {reinterpret_cast<const u8*>(input.data()), static_cast<u32>(input.size())}, &out);
    EXPECT_EQ(s.code, StatusCode::Ok);

    char hex[65];
    EXPECT_EQ(hashcore::encoding::hex_encode({out.data(), 32}, hex, sizeof(hex)).code, StatusCode::Ok);
    return std::string(hex);
}
} // namespace

// FIPS 202 / NIST CAVP vectors
TEST(SecurityDigest, Sha3EmptyString) {
    EXPECT_EQ(sha3_hex(""), "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a");
}

TEST(SecurityDigest, Sha3Abc) {
    EXPECT_EQ(sha3_hex("abc"), "3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532");
}

TEST(SecurityDigest, Sha3Hello) {
    EXPECT_EQ(sha3_hex("hello"), "3338be694f50c5f338814986cdf0686453a888b84f424d792af4b9202398f392");
}

TEST(SecurityDigest, Sha3MillionA) {
    EXPECT_EQ(sha3_hex(std::string(1000000, 'a')),
              "5c8875ae474a3634ba4fd55ec85bffd661f32aca75c6d699d0cdcb6c115891c1");
}

TEST(SecurityDigest, NullDataWithZeroLength) {
    Digest256 out{};
    out.fill(0xcc);
    EXPECT_EQ(hashcore::security::sha3_256({nullptr, 0}, &out).code, StatusCode::Ok);
    EXPECT_EQ(out[0], 0xa7);
}

TEST(SecurityDigest, InvalidWhenOutNull) {
    const auto s = hashcore::security::sha3_256({nullptr, 0}, nullptr);
    EXPECT_EQ(s.domain, StatusDomain::Security);
    EXPECT_EQ(s.code, StatusCode::Invalid);
}

TEST(SecurityDigest, InvalidWhenDataNullButLenNonZero) {
    Digest256 out{};
    out.fill(0xcc);
    const auto s = hashcore::security::sha3_256({nullptr, 1}, &out);
    EXPECT_EQ(s.domain, StatusDomain::Security);
    EXPECT_EQ(s.code, StatusCode::Invalid);
    EXPECT_EQ(out[0], 0xcc);
}

TEST(SecurityDigest, CryptoErrorStringWithoutCode) {
    char buf[64];
    hashcore::security::crypto_error_string(0, buf, sizeof(buf));
    EXPECT_STREQ(buf, "no OpenSSL error recorded");
}
