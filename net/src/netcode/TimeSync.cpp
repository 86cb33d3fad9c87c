/**
 * @file TimeSync.cpp
 * @brief TimeSync implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/netcode/TimeSync.hpp>

#include <numeric>

namespace rwn::net::netcode {

void TimeSync::advanceFrame(core::Frame frame, core::i32 localAdvantage, core::i32 remoteAdvantage) noexcept
{
    if (!frame.isValid())
        return;
    const auto slot = frame.slot(core::kFrameWindowSize);
    local_[slot]  = localAdvantage;
    remote_[slot] = remoteAdvantage;
}

core::i32 TimeSync::averageFrameAdvantage() const noexcept
{
    const auto window    = static_cast<core::f32>(core::kFrameWindowSize);
    const auto localAvg  = static_cast<core::f32>(std::accumulate(local_.begin(), local_.end(), 0)) / window;
    const auto remoteAvg = static_cast<core::f32>(std::accumulate(remote_.begin(), remote_.end(), 0)) / window;
    return static_cast<core::i32>((remoteAvg - localAvg) / 2.0f);
}

} // namespace rwn::net::netcode
