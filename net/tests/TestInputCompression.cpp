/**
 * @file TestInputCompression.cpp
 * @brief Unit tests for protocol::BitfieldRle and protocol::InputCompression.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/net/protocol/InputCompression.hpp"

#include <vector>

namespace rwn::net::protocol {

namespace {

std::vector<core::byte> bytesOf(std::initializer_list<core::u8> values)
{
    std::vector<core::byte> out;
    for (const auto v : values)
        out.push_back(core::byte{v});
    return out;
}

} // namespace

TEST_CASE("BitfieldRle collapses zero runs into one header", "[protocol][compression]")
{
    const std::vector<core::byte> zeros(64, core::byte{0});
    const auto encoded = BitfieldRle::encode(zeros);
    // (64 << 2) | 1 = 257, two varint bytes.
    REQUIRE(encoded.size() == 2);

    const auto decoded = BitfieldRle::decode(encoded, 64);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == zeros);
}

TEST_CASE("BitfieldRle keeps short runs as literals", "[protocol][compression]")
{
    const auto data = bytesOf({0x00, 0x00, 0x17, 0xFF, 0xFF, 0xFF, 0xFF, 0x42});
    const auto encoded = BitfieldRle::encode(data);

    const auto decoded = BitfieldRle::decode(encoded, data.size());
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == data);
}

TEST_CASE("BitfieldRle rejects output larger than allowed", "[protocol][compression]")
{
    const std::vector<core::byte> zeros(64, core::byte{0});
    const auto encoded = BitfieldRle::encode(zeros);

    const auto decoded = BitfieldRle::decode(encoded, 63);
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kMalformedMessage);
}

TEST_CASE("BitfieldRle rejects truncated literals", "[protocol][compression]")
{
    // Header announces 4 literal bytes, only 1 follows.
    const auto encoded = bytesOf({4u << 1, 0xAA});
    const auto decoded = BitfieldRle::decode(encoded, 16);
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kMalformedMessage);
}

TEST_CASE("InputCompression makes held inputs nearly free", "[protocol][compression]")
{
    const auto reference = bytesOf({0x01, 0x80, 0x00, 0x7F});
    const std::vector<std::vector<core::byte>> held(20, reference);

    const auto encoded = InputCompression::encode(reference, held);
    REQUIRE(encoded.has_value());
    REQUIRE(encoded->size() <= 2);

    const auto decoded = InputCompression::decode(reference, *encoded, 20);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == held);
}

TEST_CASE("InputCompression restores changing inputs", "[protocol][compression]")
{
    const auto reference = bytesOf({0x00, 0x00});
    const std::vector<std::vector<core::byte>> inputs{
        bytesOf({0x01, 0x00}),
        bytesOf({0x01, 0x10}),
        bytesOf({0xFF, 0xFF}),
    };

    const auto encoded = InputCompression::encode(reference, inputs);
    REQUIRE(encoded.has_value());

    const auto decoded = InputCompression::decode(reference, *encoded, 8);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == inputs);
}

TEST_CASE("InputCompression rejects inputs of the wrong size", "[protocol][compression]")
{
    const auto reference = bytesOf({0x00, 0x00});
    const std::vector<std::vector<core::byte>> inputs{bytesOf({0x01})};

    const auto encoded = InputCompression::encode(reference, inputs);
    REQUIRE_FALSE(encoded.has_value());
    REQUIRE(encoded.error().code() == core::ErrorCode::kInvalidRequest);
}

TEST_CASE("InputCompression rejects a partial input", "[protocol][compression]")
{
    const auto reference = bytesOf({0x00, 0x00});
    const auto encoded = BitfieldRle::encode(bytesOf({0x01, 0x02, 0x03}));

    const auto decoded = InputCompression::decode(reference, encoded, 8);
    REQUIRE_FALSE(decoded.has_value());
    REQUIRE(decoded.error().code() == core::ErrorCode::kMalformedMessage);
}

} // namespace rwn::net::protocol
