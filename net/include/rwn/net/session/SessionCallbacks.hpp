// /////////////////////////////////////////////////////////////////////////////
/// @file SessionCallbacks.hpp
/// @brief Host hooks through which a session saves, restores and steps
///        the game state.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/netcode/GameInput.hpp>
#include <rwn/net/session/SessionEvent.hpp>
#include <rwn/core/Frame.hpp>

#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace rwn::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @struct SavedStateData
/// @brief Snapshot returned by the host.
///
/// Without a checksum the session hashes @c bytes with math::StateHash.
// /////////////////////////////////////////////////////////////////////////////
struct SavedStateData
{
    std::vector<core::byte>  bytes;
    std::optional<core::u64> checksum;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct SessionCallbacks
/// @brief The three state hooks are mandatory, @c onEvent is optional.
///
/// @c advanceFrame receives @c replay == true while re-simulating after a
/// rollback; the host must skip irreversible side effects (sound, sends)
/// on those frames.
// /////////////////////////////////////////////////////////////////////////////
struct SessionCallbacks
{
    std::function<SavedStateData(core::Frame)>                                    saveState;
    std::function<void(core::Frame, std::span<const core::byte>)>                 loadState;
    std::function<void(std::span<const netcode::PlayerFrameInput>, bool replay)>  advanceFrame;
    std::function<void(const SessionEvent &)>                                     onEvent;

    [[nodiscard]] bool complete() const noexcept { return saveState && loadState && advanceFrame; }
};

} // namespace rwn::net::session
