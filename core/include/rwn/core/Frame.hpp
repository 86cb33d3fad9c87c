/**
 * @file Frame.hpp
 * @brief Simulation tick identifier and validated player handle.
 *
 * Frame wraps a signed 32-bit tick number with a distinguished null value
 * (-1, "no frame yet"). Offset arithmetic saturates instead of wrapping so
 * that a long match can never alias an old frame in a ring buffer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_FRAME_HPP
    #define RWN_CORE_FRAME_HPP

    #include "Expected.hpp"
    #include "Types.hpp"

    #include <compare>
    #include <format>
    #include <limits>

namespace rwn::core {

/**
 * @brief Monotonic simulation tick number.
 */
class Frame final
{
public:
    static constexpr i32 kNullValue = -1;
    static constexpr i32 kMaxValue  = std::numeric_limits<i32>::max();

    /// @brief Constructs the null frame.
    constexpr Frame() noexcept = default;

    /// @brief Constructs a frame; negative values collapse to null.
    constexpr explicit Frame(i32 value) noexcept
        : value_(value < kNullValue ? kNullValue : value) {}

    [[nodiscard]] static constexpr Frame null() noexcept { return Frame{}; }

    [[nodiscard]] constexpr i32  value()   const noexcept { return value_; }
    [[nodiscard]] constexpr bool isNull()  const noexcept { return value_ == kNullValue; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ >= 0; }

    /**
     * @brief Adds @p delta, failing instead of saturating.
     * @return The new frame, or kInvalidRequest on overflow or when the
     *         result would fall below frame 0.
     */
    [[nodiscard]] Expected<Frame> checkedAdd(i32 delta) const
    {
        const i64 sum = static_cast<i64>(value_) + delta;
        if (isNull() || sum < 0 || sum > kMaxValue)
            return makeError(ErrorCode::kInvalidRequest,
                             std::format("frame arithmetic out of range ({} + {})", value_, delta));
        return Frame{static_cast<i32>(sum)};
    }

    /// @brief Ring slot of this frame in a buffer of @p capacity entries.
    [[nodiscard]] constexpr usize slot(usize capacity) const noexcept
    {
        return static_cast<usize>(value_) % capacity;
    }

    constexpr Frame &operator++() noexcept
    {
        *this = *this + 1;
        return *this;
    }

    [[nodiscard]] friend constexpr Frame operator+(Frame f, i32 delta) noexcept
    {
        return Frame{clamp(static_cast<i64>(f.value_) + delta)};
    }

    [[nodiscard]] friend constexpr Frame operator-(Frame f, i32 delta) noexcept
    {
        return Frame{clamp(static_cast<i64>(f.value_) - delta)};
    }

    /// @brief Signed distance between two frames, clamped to i32.
    [[nodiscard]] friend constexpr i32 operator-(Frame a, Frame b) noexcept
    {
        const i64 diff = static_cast<i64>(a.value_) - b.value_;
        if (diff > kMaxValue)
            return kMaxValue;
        if (diff < std::numeric_limits<i32>::min())
            return std::numeric_limits<i32>::min();
        return static_cast<i32>(diff);
    }

    constexpr auto operator<=>(const Frame &) const noexcept = default;

private:
    static constexpr i32 clamp(i64 v) noexcept
    {
        if (v > kMaxValue)
            return kMaxValue;
        if (v < kNullValue)
            return kNullValue;
        return static_cast<i32>(v);
    }

    i32 value_{kNullValue};
};

/**
 * @brief Index of a player slot, validated against the session size.
 */
class PlayerHandle final
{
public:
    constexpr PlayerHandle() noexcept = default;
    constexpr explicit PlayerHandle(u32 index) noexcept : index_(index) {}

    /**
     * @brief Validated construction.
     * @return The handle, or kInvalidPlayer when @p index >= @p numPlayers.
     */
    [[nodiscard]] static Expected<PlayerHandle> create(u32 index, u32 numPlayers)
    {
        if (index >= numPlayers)
            return makeError(ErrorCode::kInvalidPlayer,
                             std::format("player handle {} out of range (players: {})", index, numPlayers));
        return PlayerHandle{index};
    }

    [[nodiscard]] constexpr u32  index()                     const noexcept { return index_; }
    [[nodiscard]] constexpr bool isValidFor(u32 numPlayers) const noexcept { return index_ < numPlayers; }

    constexpr auto operator<=>(const PlayerHandle &) const noexcept = default;

private:
    u32 index_{0};
};

} // namespace rwn::core

#endif // RWN_CORE_FRAME_HPP
