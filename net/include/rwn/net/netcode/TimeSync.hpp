// /////////////////////////////////////////////////////////////////////////////
/// @file TimeSync.hpp
/// @brief Windowed frame-advantage estimate between two peers.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/core/Constants.hpp>
#include <rwn/core/Frame.hpp>

#include <array>

namespace rwn::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @class TimeSync
/// @brief Averages how far ahead of a remote peer the local simulation runs.
///
/// A positive averageFrameAdvantage() means the local peer is ahead and
/// should idle for that many frames to let the remote peer catch up.
// /////////////////////////////////////////////////////////////////////////////
class TimeSync final
{
public:
    /// @brief Records both advantages observed when sending @p frame.
    void advanceFrame(core::Frame frame, core::i32 localAdvantage, core::i32 remoteAdvantage) noexcept;

    /// @brief Half the difference between the averaged local and remote
    ///        advantages, in frames.
    [[nodiscard]] core::i32 averageFrameAdvantage() const noexcept;

private:
    std::array<core::i32, core::kFrameWindowSize> local_{};
    std::array<core::i32, core::kFrameWindowSize> remote_{};
};

} // namespace rwn::net::netcode
