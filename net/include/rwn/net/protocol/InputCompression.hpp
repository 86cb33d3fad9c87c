/**
 * @file InputCompression.hpp
 * @brief XOR delta + bitfield run-length compression for input batches.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#pragma once

#ifndef RWN_NET_PROTOCOL_INPUTCOMPRESSION_HPP
    #define RWN_NET_PROTOCOL_INPUTCOMPRESSION_HPP

#include <rwn/core/Expected.hpp>
#include <rwn/core/Types.hpp>

#include <span>
#include <vector>

namespace rwn::net::protocol {

/**
 * @class BitfieldRle
 * @brief Run-length coding tuned for sparse XOR deltas.
 *
 * The stream is a sequence of varint headers. An odd header is a run:
 * bit 1 selects 0xFF over 0x00 and the remaining bits give the length. An
 * even header is followed by (header >> 1) literal bytes.
 */
class BitfieldRle
{
public:
    [[nodiscard]] static std::vector<core::byte> encode(std::span<const core::byte> data);

    /// @param maxSize Upper bound on the decoded size.
    /// @return kMalformedMessage for truncated or oversized input.
    [[nodiscard]] static core::Expected<std::vector<core::byte>> decode(
        std::span<const core::byte> data,
        core::usize maxSize);
};

/**
 * @class InputCompression
 * @brief Encodes a batch of equally-sized inputs against a reference.
 *
 * Every input is XORed with @p reference (the last input the receiver
 * acknowledged), the results are concatenated and run-length coded.
 * Consecutive frames of a held button therefore cost a few bytes.
 */
class InputCompression
{
public:
    /**
     * @brief Compresses @p inputs.
     * @return kInvalidRequest if an input's size differs from the reference.
     */
    [[nodiscard]] static core::Expected<std::vector<core::byte>> encode(
        std::span<const core::byte> reference,
        std::span<const std::vector<core::byte>> inputs);

    /**
     * @brief Reverses @ref encode.
     * @param maxInputs Upper bound on the number of inputs accepted.
     * @return kMalformedMessage when @p data is not a valid batch.
     */
    [[nodiscard]] static core::Expected<std::vector<std::vector<core::byte>>> decode(
        std::span<const core::byte> reference,
        std::span<const core::byte> data,
        core::usize maxInputs);
};

} // namespace rwn::net::protocol

#endif // RWN_NET_PROTOCOL_INPUTCOMPRESSION_HPP
