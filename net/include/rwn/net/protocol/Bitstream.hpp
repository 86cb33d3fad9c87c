// /////////////////////////////////////////////////////////////////////////////
/// @file Bitstream.hpp
/// @brief Bit-level serialization stream for wire messages.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/core/Expected.hpp>
#include <rwn/core/Frame.hpp>
#include <rwn/core/NonCopyable.hpp>
#include <rwn/core/Types.hpp>

#include <span>
#include <vector>

namespace rwn::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class Bitstream
/// @brief Compact bit-level read/write stream.
///
/// Values are stored most-significant bit first, independent of host
/// endianness. Reads past the end fail with kMalformedMessage instead of
/// returning garbage, since every read stream comes off the network.
// /////////////////////////////////////////////////////////////////////////////
class Bitstream final : public core::NonCopyable<Bitstream>
{
public:
    /// @brief Constructs an empty writable bitstream.
    Bitstream() noexcept = default;

    /// @brief Constructs a read-only bitstream over received bytes.
    explicit Bitstream(std::span<const core::byte> data);

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Writes the low @p bitCount bits of @p value (1-32).
    void writeBits(core::u32 value, core::u32 bitCount);

    void writeBool(bool value);
    void writeU8(core::u8 value);
    void writeU16(core::u16 value);
    void writeU32(core::u32 value);
    void writeU64(core::u64 value);
    void writeI16(core::i16 value);
    void writeI32(core::i32 value);

    /// @brief Writes a frame number (null encodes as -1).
    void writeFrame(core::Frame frame);

    /// @brief LEB128 variable-length unsigned integer.
    void writeVarint(core::u64 value);

    /// @brief Writes raw bytes (byte-aligned).
    void writeBytes(std::span<const core::byte> bytes);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<core::u32> readBits(core::u32 bitCount);
    [[nodiscard]] core::Expected<bool>      readBool();
    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u16> readU16();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::u64> readU64();
    [[nodiscard]] core::Expected<core::i16> readI16();
    [[nodiscard]] core::Expected<core::i32> readI32();
    [[nodiscard]] core::Expected<core::Frame> readFrame();
    [[nodiscard]] core::Expected<core::u64> readVarint();

    /// @brief Reads @p count raw bytes.
    [[nodiscard]] core::Expected<std::vector<core::byte>> readBytes(core::u32 count);

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::u32 bitsWritten()   const noexcept { return writeBit_; }
    [[nodiscard]] core::u32 bitsRemaining() const noexcept { return totalBits_ - readBit_; }

    /// @brief Written bytes, the last one zero-padded.
    [[nodiscard]] std::span<const core::byte> data() const noexcept { return buffer_; }

    /// @brief Moves the written bytes out, leaving the stream empty.
    [[nodiscard]] std::vector<core::byte> release() noexcept;

private:
    [[nodiscard]] core::Expected<void> require(core::u64 bits) const;

    std::vector<core::byte> buffer_;
    core::u32               writeBit_{0};
    core::u32               readBit_{0};
    core::u32               totalBits_{0};
};

} // namespace rwn::net::protocol
