/**
 * @file Bitstream.cpp
 * @brief Bitstream implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/protocol/Bitstream.hpp>

#include <format>

namespace rwn::net::protocol {

namespace {

constexpr core::u32 kMaxVarintBytes = 10;

} // namespace

Bitstream::Bitstream(std::span<const core::byte> data)
    : buffer_(data.begin(), data.end())
    , totalBits_{static_cast<core::u32>(data.size() * 8)}
{}

void Bitstream::writeBits(core::u32 value, core::u32 bitCount)
{
    for (core::u32 i = bitCount; i-- > 0;)
    {
        const core::u32 byteIndex = writeBit_ / 8;
        if (byteIndex >= buffer_.size())
            buffer_.push_back(core::byte{0});

        if ((value >> i) & 1u)
            buffer_[byteIndex] |= core::byte{static_cast<core::u8>(0x80u >> (writeBit_ % 8))};
        ++writeBit_;
    }
}

void Bitstream::writeBool(bool value)       { writeBits(value ? 1u : 0u, 1); }
void Bitstream::writeU8(core::u8 value)     { writeBits(value, 8); }
void Bitstream::writeU16(core::u16 value)   { writeBits(value, 16); }
void Bitstream::writeU32(core::u32 value)   { writeBits(value, 32); }
void Bitstream::writeI16(core::i16 value)   { writeU16(static_cast<core::u16>(value)); }
void Bitstream::writeI32(core::i32 value)   { writeU32(static_cast<core::u32>(value)); }
void Bitstream::writeFrame(core::Frame f)   { writeI32(f.value()); }

void Bitstream::writeU64(core::u64 value)
{
    writeU32(static_cast<core::u32>(value >> 32));
    writeU32(static_cast<core::u32>(value));
}

void Bitstream::writeVarint(core::u64 value)
{
    do
    {
        core::u8 chunk = static_cast<core::u8>(value & 0x7Fu);
        value >>= 7;
        if (value != 0)
            chunk |= 0x80u;
        writeU8(chunk);
    } while (value != 0);
}

void Bitstream::writeBytes(std::span<const core::byte> bytes)
{
    for (const core::byte b : bytes)
        writeU8(static_cast<core::u8>(b));
}

core::Expected<void> Bitstream::require(core::u64 bits) const
{
    if (bits > bitsRemaining())
    {
        return core::makeError(core::ErrorCode::kMalformedMessage,
                               std::format("truncated stream: need {} bits, {} left", bits, bitsRemaining()));
    }
    return {};
}

core::Expected<core::u32> Bitstream::readBits(core::u32 bitCount)
{
    RWN_TRY_VOID(require(bitCount));

    core::u32 value = 0;
    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const auto current = static_cast<core::u8>(buffer_[readBit_ / 8]);
        value = (value << 1) | ((current >> (7 - readBit_ % 8)) & 1u);
        ++readBit_;
    }
    return value;
}

core::Expected<bool> Bitstream::readBool()
{
    return RWN_TRY(readBits(1)) != 0;
}

core::Expected<core::u8> Bitstream::readU8()
{
    return static_cast<core::u8>(RWN_TRY(readBits(8)));
}

core::Expected<core::u16> Bitstream::readU16()
{
    return static_cast<core::u16>(RWN_TRY(readBits(16)));
}

core::Expected<core::u32> Bitstream::readU32()
{
    return readBits(32);
}

core::Expected<core::u64> Bitstream::readU64()
{
    const core::u64 high = RWN_TRY(readU32());
    const core::u64 low  = RWN_TRY(readU32());
    return (high << 32) | low;
}

core::Expected<core::i16> Bitstream::readI16()
{
    return static_cast<core::i16>(RWN_TRY(readU16()));
}

core::Expected<core::i32> Bitstream::readI32()
{
    return static_cast<core::i32>(RWN_TRY(readU32()));
}

core::Expected<core::Frame> Bitstream::readFrame()
{
    const core::i32 raw = RWN_TRY(readI32());
    if (raw < core::Frame::kNullValue)
        return core::makeError(core::ErrorCode::kMalformedMessage, std::format("invalid frame number {}", raw));
    return core::Frame{raw};
}

core::Expected<core::u64> Bitstream::readVarint()
{
    core::u64 value = 0;
    for (core::u32 i = 0; i < kMaxVarintBytes; ++i)
    {
        const core::u8 chunk = RWN_TRY(readU8());
        value |= static_cast<core::u64>(chunk & 0x7Fu) << (7 * i);
        if ((chunk & 0x80u) == 0)
            return value;
    }
    return core::makeError(core::ErrorCode::kMalformedMessage, "varint longer than 10 bytes");
}

core::Expected<std::vector<core::byte>> Bitstream::readBytes(core::u32 count)
{
    RWN_TRY_VOID(require(static_cast<core::u64>(count) * 8));

    std::vector<core::byte> out;
    out.reserve(count);
    for (core::u32 i = 0; i < count; ++i)
        out.push_back(core::byte{RWN_TRY(readU8())});
    return out;
}

std::vector<core::byte> Bitstream::release() noexcept
{
    std::vector<core::byte> out = std::move(buffer_);
    buffer_.clear();
    writeBit_ = 0;
    return out;
}

} // namespace rwn::net::protocol
