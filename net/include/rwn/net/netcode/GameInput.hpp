// /////////////////////////////////////////////////////////////////////////////
/// @file GameInput.hpp
/// @brief Fixed-capacity per-player input payload tagged with a frame.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/core/Concepts.hpp>
#include <rwn/core/Constants.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/Frame.hpp>
#include <rwn/core/Types.hpp>

#include <array>
#include <cstring>
#include <span>

namespace rwn::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @enum InputStatus
/// @brief Provenance of an input handed to the simulation.
// /////////////////////////////////////////////////////////////////////////////
enum class InputStatus : core::u8
{
    Confirmed,
    Predicted,
    Disconnected
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct GameInput
/// @brief One player's input for one frame.
///
/// Trivially copyable so that queues and prediction slots are plain
/// arrays. Only the first @c size bytes of @c bits are meaningful; the rest
/// stay zero so that bitwise comparison is well defined.
// /////////////////////////////////////////////////////////////////////////////
struct GameInput
{
    core::Frame                                  frame{};
    core::u32                                    size{0};
    std::array<core::byte, core::kMaxInputBytes> bits{};

    /// @brief Blank (all-zero) input of @p size bytes.
    [[nodiscard]] static GameInput blank(core::Frame frame, core::u32 size) noexcept
    {
        GameInput input;
        input.frame = frame;
        input.size  = size;
        return input;
    }

    /// @brief Copies @p bytes into a new input.
    /// @return kInvalidRequest if @p bytes exceeds kMaxInputBytes.
    [[nodiscard]] static core::Expected<GameInput> fromBytes(core::Frame frame,
                                                             std::span<const core::byte> bytes);

    /// @brief Wraps a host POD input structure.
    template <core::Blittable T>
        requires (sizeof(T) <= core::kMaxInputBytes)
    [[nodiscard]] static GameInput from(core::Frame frame, const T &value) noexcept
    {
        GameInput input = blank(frame, static_cast<core::u32>(sizeof(T)));
        std::memcpy(input.bits.data(), &value, sizeof(T));
        return input;
    }

    /// @brief Reinterprets the payload as a host POD input structure.
    template <core::Blittable T>
        requires (sizeof(T) <= core::kMaxInputBytes)
    [[nodiscard]] T as() const noexcept
    {
        T value{};
        std::memcpy(&value, bits.data(), sizeof(T));
        return value;
    }

    [[nodiscard]] std::span<const core::byte> bytes() const noexcept
    {
        return {bits.data(), size};
    }

    /// @brief Payload equality, ignoring the frame tag.
    [[nodiscard]] bool sameBits(const GameInput &other) const noexcept;

    /// @brief Zeroes the payload, keeping frame and size.
    void erase() noexcept { bits.fill(core::byte{0}); }
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct PlayerFrameInput
/// @brief Input of one player as handed to the host for one frame.
// /////////////////////////////////////////////////////////////////////////////
struct PlayerFrameInput
{
    core::PlayerHandle handle{};
    GameInput          input{};
    InputStatus        status{InputStatus::Confirmed};

    [[nodiscard]] bool predicted() const noexcept { return status == InputStatus::Predicted; }
};

} // namespace rwn::net::netcode
