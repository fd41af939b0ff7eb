// Unit tests for Base58 (Bitcoin alphabet)
#include "util/base58.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace peerwatch::util;

namespace {
std::vector<uint8_t> Bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}
} // namespace

TEST_CASE("Base58 - known vectors", "[util][base58]") {
    REQUIRE(EncodeBase58({}) == "");
    REQUIRE(EncodeBase58({0x00}) == "1");
    REQUIRE(EncodeBase58({0x00, 0x00, 0x00}) == "111");
    REQUIRE(EncodeBase58({0x61}) == "2g");
    REQUIRE(EncodeBase58({0x62, 0x62, 0x62}) == "a3gV");
    REQUIRE(EncodeBase58(Bytes("Hello World!")) == "2NEpo7TZRRrLZSi2U");
    REQUIRE(EncodeBase58({0x51, 0x6b, 0x6f, 0xcd, 0x0f}) == "ABnLTmg");
    REQUIRE(EncodeBase58({0x57, 0x2e, 0x47, 0x94}) == "3EFU7m");
    REQUIRE(EncodeBase58({0x10, 0xc8, 0x51, 0x1e}) == "Rt5zm");
}

TEST_CASE("Base58 - decode", "[util][base58]") {
    SECTION("Valid strings") {
        REQUIRE(DecodeBase58("2NEpo7TZRRrLZSi2U") == Bytes("Hello World!"));
        REQUIRE(DecodeBase58("3EFU7m") == std::vector<uint8_t>{0x57, 0x2e, 0x47, 0x94});
        REQUIRE(DecodeBase58("1111") == std::vector<uint8_t>{0x00, 0x00, 0x00, 0x00});
        REQUIRE(DecodeBase58("") == std::vector<uint8_t>{});
    }

    SECTION("Characters outside the alphabet") {
        REQUIRE_FALSE(DecodeBase58("0").has_value());
        REQUIRE_FALSE(DecodeBase58("O").has_value());
        REQUIRE_FALSE(DecodeBase58("I").has_value());
        REQUIRE_FALSE(DecodeBase58("l").has_value());
        REQUIRE_FALSE(DecodeBase58("2NEpo 7TZ").has_value());
    }

    SECTION("Leading zero bytes survive") {
        std::vector<uint8_t> data{0x00, 0x00, 0x01, 0x02, 0xff};
        REQUIRE(DecodeBase58(EncodeBase58(data)) == data);
    }
}
