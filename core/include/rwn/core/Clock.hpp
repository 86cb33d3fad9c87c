/**
 * @file Clock.hpp
 * @brief Injectable millisecond clock.
 *
 * Protocol timers (retries, keep-alives, disconnect detection) read time
 * exclusively through IClock so that tests can drive them with
 * ManualClock instead of sleeping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_CLOCK_HPP
    #define RWN_CORE_CLOCK_HPP

    #include "Types.hpp"

    #include <chrono>

namespace rwn::core {

/**
 * @brief Abstract monotonic millisecond source.
 */
class IClock
{
public:
    virtual ~IClock() = default;

    /// @brief Milliseconds since an arbitrary, fixed epoch.
    [[nodiscard]] virtual u64 nowMs() const = 0;
};

/**
 * @brief IClock backed by std::chrono::steady_clock.
 */
class SteadyClock final : public IClock
{
public:
    using Clock = std::chrono::steady_clock;

    SteadyClock() : epoch_(Clock::now()) {}

    [[nodiscard]] u64 nowMs() const override
    {
        const auto elapsed = Clock::now() - epoch_;
        return static_cast<u64>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    }

private:
    Clock::time_point epoch_;
};

/**
 * @brief Hand-driven clock for deterministic tests and replays.
 */
class ManualClock final : public IClock
{
public:
    explicit ManualClock(u64 startMs = 0) noexcept : now_(startMs) {}

    [[nodiscard]] u64 nowMs() const override { return now_; }

    void advance(u64 ms) noexcept { now_ += ms; }
    void set(u64 ms) noexcept { now_ = ms; }

private:
    u64 now_;
};

} // namespace rwn::core

#endif // RWN_CORE_CLOCK_HPP
