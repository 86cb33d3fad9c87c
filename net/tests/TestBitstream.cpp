/**
 * @file TestBitstream.cpp
 * @brief Unit tests for protocol::Bitstream.
 */

#include <catch2/catch_test_macros.hpp>

#include "rwn/net/protocol/Bitstream.hpp"

#include <vector>

namespace rwn::net::protocol {

TEST_CASE("Bitstream packs fields without padding", "[protocol][bitstream]")
{
    Bitstream out;
    out.writeBool(true);
    out.writeBits(0b101, 3);
    out.writeU8(0xAB);
    out.writeFrame(core::Frame::null());
    REQUIRE(out.bitsWritten() == 1 + 3 + 8 + 32);

    const auto bytes = out.release();
    REQUIRE(bytes.size() == 6);
    // 1 101 1010 | 1011 ...
    REQUIRE(bytes[0] == core::byte{0xDA});

    Bitstream in{bytes};
    REQUIRE(in.readBool().value());
    REQUIRE(in.readBits(3).value() == 0b101);
    REQUIRE(in.readU8().value() == 0xAB);
    REQUIRE(in.readFrame().value().isNull());
    REQUIRE(in.bitsRemaining() == 4);
}

TEST_CASE("Bitstream round-trips signed and wide values", "[protocol][bitstream]")
{
    Bitstream out;
    out.writeI16(-1234);
    out.writeI32(-70000);
    out.writeU64(0x0123456789ABCDEFull);
    out.writeVarint(300);

    const auto bytes = out.release();
    Bitstream in{bytes};
    REQUIRE(in.readI16().value() == -1234);
    REQUIRE(in.readI32().value() == -70000);
    REQUIRE(in.readU64().value() == 0x0123456789ABCDEFull);
    REQUIRE(in.readVarint().value() == 300);
}

TEST_CASE("Bitstream varint uses seven bits per byte", "[protocol][bitstream]")
{
    Bitstream small;
    small.writeVarint(127);
    REQUIRE(small.bitsWritten() == 8);

    Bitstream large;
    large.writeVarint(128);
    REQUIRE(large.bitsWritten() == 16);
}

TEST_CASE("Bitstream reports truncation as a malformed message", "[protocol][bitstream]")
{
    const std::vector<core::byte> bytes{core::byte{0x01}, core::byte{0x02}};
    Bitstream in{bytes};

    auto value = in.readU32();
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code() == core::ErrorCode::kMalformedMessage);

    Bitstream again{bytes};
    REQUIRE_FALSE(again.readBytes(3).has_value());
    REQUIRE(again.readBytes(2).has_value());
}

TEST_CASE("Bitstream rejects an endless varint", "[protocol][bitstream]")
{
    const std::vector<core::byte> bytes(12, core::byte{0x80});
    Bitstream in{bytes};
    auto value = in.readVarint();
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code() == core::ErrorCode::kMalformedMessage);
}

TEST_CASE("Bitstream rejects negative frames other than null", "[protocol][bitstream]")
{
    Bitstream out;
    out.writeI32(-7);
    const auto bytes = out.release();

    Bitstream in{bytes};
    auto frame = in.readFrame();
    REQUIRE_FALSE(frame.has_value());
    REQUIRE(frame.error().code() == core::ErrorCode::kMalformedMessage);
}

} // namespace rwn::net::protocol
