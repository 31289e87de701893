#include <string>

#include <gtest/gtest.h>

#include "hashcore/core/errors.hpp"

using namespace hashcore::core;

namespace {
static std::string describe(Status s) {
    char buf[256];
    status_describe(s, buf, sizeof(buf));
    return std::string(buf);
}
} // namespace

TEST(CoreErrors, DefaultIsOk) {
    const Status s{};
    EXPECT_TRUE(is_ok(s));
    EXPECT_TRUE(is_ok(ok_status()));
    EXPECT_EQ(describe(s), "ok");
}

TEST(CoreErrors, MakeStatus) {
    constexpr Status s = make_status(StatusDomain::Security, StatusCode::Crypto, 42);
    static_assert(!is_ok(s));
    EXPECT_EQ(s.domain, StatusDomain::Security);
    EXPECT_EQ(s.code, StatusCode::Crypto);
    EXPECT_EQ(s.aux, 42u);
}

TEST(CoreErrors, CodeNames) {
    EXPECT_STREQ(status_code_name(StatusCode::Ok), "Ok");
    EXPECT_STREQ(status_code_name(StatusCode::Invalid), "Invalid");
    EXPECT_STREQ(status_code_name(StatusCode::InvalidLength), "InvalidLength");
    EXPECT_STREQ(status_code_name(StatusCode::InvalidHex), "InvalidHex");
    EXPECT_STREQ(status_code_name(StatusCode::Crypto), "Crypto");
    EXPECT_STREQ(status_code_name(StatusCode::Unavailable), "Unavailable");
    EXPECT_STREQ(status_domain_name(StatusDomain::Core), "Core");
    EXPECT_STREQ(status_domain_name(StatusDomain::Encoding), "Encoding");
    EXPECT_STREQ(status_domain_name(StatusDomain::Security), "Security");
    EXPECT_STREQ(status_domain_name(StatusDomain::External), "External");
}

TEST(CoreErrors, DescribeInvalidLength) {
    EXPECT_EQ(describe(make_status(StatusDomain::Core, StatusCode::InvalidLength, 33)),
              "invalid hash length: expected 32 bytes, got 33");
}

TEST(CoreErrors, DescribeInvalidHex) {
    EXPECT_EQ(describe(make_status(StatusDomain::Core, StatusCode::InvalidHex, 63)),
              "invalid hex hash: expected 32 bytes (64 hex digits), got 63 hex digits");
    EXPECT_EQ(describe(make_status(StatusDomain::Core, StatusCode::InvalidHex, kHexAuxBadDigit | 5)),
              "invalid hex hash: expected 32 bytes, character at offset 5 is not a hex digit");
    EXPECT_EQ(describe(make_status(StatusDomain::Encoding, StatusCode::InvalidHex, 3)),
              "invalid hex: cannot decode 3 hex digits");
}

TEST(CoreErrors, DescribeCrypto) {
    const std::string msg = describe(make_status(StatusDomain::Security, StatusCode::Crypto));
    EXPECT_EQ(msg.rfind("digest computation failed: ", 0), 0u) << msg;
}

TEST(CoreErrors, DescribeFallback) {
    EXPECT_EQ(describe(make_status(StatusDomain::Security, StatusCode::Unavailable, 0)),
              "Security failed (code=Unavailable/7, aux=0)");
}

TEST(CoreErrors, DescribeTruncates) {
    char buf[8];
    status_describe(make_status(StatusDomain::Core, StatusCode::InvalidLength, 1), buf, sizeof(buf));
    EXPECT_EQ(std::string(buf), "invalid");
}
