/**
 * @file InputCompression.cpp
 * @brief Delta and run-length coding of input batches.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/protocol/InputCompression.hpp>
#include <rwn/net/protocol/Bitstream.hpp>

#include <format>

namespace rwn::net::protocol {

namespace {

constexpr core::usize kMinRun = 3;

[[nodiscard]] bool isRunByte(core::byte b) noexcept
{
    return b == core::byte{0x00} || b == core::byte{0xFF};
}

[[nodiscard]] core::usize runLength(std::span<const core::byte> data, core::usize start) noexcept
{
    core::usize end = start;
    while (end < data.size() && data[end] == data[start])
        ++end;
    return end - start;
}

} // namespace

std::vector<core::byte> BitfieldRle::encode(std::span<const core::byte> data)
{
    Bitstream out;
    core::usize literalStart = 0;
    core::usize i = 0;

    const auto flushLiterals = [&](core::usize end) {
        if (end > literalStart)
        {
            out.writeVarint(static_cast<core::u64>(end - literalStart) << 1);
            out.writeBytes(data.subspan(literalStart, end - literalStart));
        }
    };

    while (i < data.size())
    {
        const core::usize run = isRunByte(data[i]) ? runLength(data, i) : 0;
        if (run >= kMinRun)
        {
            flushLiterals(i);
            const core::u64 fill = data[i] == core::byte{0xFF} ? 2u : 0u;
            out.writeVarint((static_cast<core::u64>(run) << 2) | fill | 1u);
            i += run;
            literalStart = i;
        }
        else
        {
            ++i;
        }
    }
    flushLiterals(data.size());
    return out.release();
}

core::Expected<std::vector<core::byte>> BitfieldRle::decode(std::span<const core::byte> data,
                                                            core::usize maxSize)
{
    Bitstream in{data};
    std::vector<core::byte> out;

    while (in.bitsRemaining() >= 8)
    {
        const core::u64 header = RWN_TRY(in.readVarint());
        const core::u64 length = (header & 1u) ? header >> 2 : header >> 1;
        if (length > maxSize - out.size())
        {
            return core::makeError(core::ErrorCode::kMalformedMessage,
                                   std::format("run-length data expands past {} bytes", maxSize));
        }

        if (header & 1u)
        {
            const core::byte fill = (header & 2u) ? core::byte{0xFF} : core::byte{0x00};
            out.insert(out.end(), static_cast<core::usize>(length), fill);
        }
        else
        {
            const auto literal = RWN_TRY(in.readBytes(static_cast<core::u32>(length)));
            out.insert(out.end(), literal.begin(), literal.end());
        }
    }
    return out;
}

core::Expected<std::vector<core::byte>> InputCompression::encode(
    std::span<const core::byte> reference,
    std::span<const std::vector<core::byte>> inputs)
{
    std::vector<core::byte> delta;
    delta.reserve(reference.size() * inputs.size());

    for (const auto &input : inputs)
    {
        if (input.size() != reference.size())
        {
            return core::makeError(core::ErrorCode::kInvalidRequest,
                                   std::format("input of {} bytes against a {}-byte reference",
                                               input.size(), reference.size()));
        }
        for (core::usize i = 0; i < input.size(); ++i)
            delta.push_back(input[i] ^ reference[i]);
    }
    return BitfieldRle::encode(delta);
}

core::Expected<std::vector<std::vector<core::byte>>> InputCompression::decode(
    std::span<const core::byte> reference,
    std::span<const core::byte> data,
    core::usize maxInputs)
{
    if (reference.empty())
        return core::makeError(core::ErrorCode::kMalformedMessage, "empty reference input");

    const auto delta = RWN_TRY(BitfieldRle::decode(data, reference.size() * maxInputs));
    if (delta.size() % reference.size() != 0)
    {
        return core::makeError(core::ErrorCode::kMalformedMessage,
                               std::format("{} delta bytes is not a multiple of {}", delta.size(), reference.size()));
    }

    std::vector<std::vector<core::byte>> inputs(delta.size() / reference.size());
    for (core::usize n = 0; n < inputs.size(); ++n)
    {
        inputs[n].resize(reference.size());
        for (core::usize i = 0; i < reference.size(); ++i)
            inputs[n][i] = delta[n * reference.size() + i] ^ reference[i];
    }
    return inputs;
}

} // namespace rwn::net::protocol
