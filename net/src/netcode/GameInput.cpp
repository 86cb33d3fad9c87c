/**
 * @file GameInput.cpp
 * @brief GameInput construction and comparison.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/netcode/GameInput.hpp>

#include <algorithm>
#include <format>

namespace rwn::net::netcode {

core::Expected<GameInput> GameInput::fromBytes(core::Frame frame, std::span<const core::byte> bytes)
{
    if (bytes.size() > core::kMaxInputBytes)
    {
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("input of {} bytes exceeds the {}-byte capacity",
                                           bytes.size(), core::kMaxInputBytes));
    }

    GameInput input = blank(frame, static_cast<core::u32>(bytes.size()));
    std::ranges::copy(bytes, input.bits.begin());
    return input;
}

bool GameInput::sameBits(const GameInput &other) const noexcept
{
    return size == other.size && std::ranges::equal(bytes(), other.bytes());
}

} // namespace rwn::net::netcode
