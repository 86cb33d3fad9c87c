// /////////////////////////////////////////////////////////////////////////////
/// @file ConnectionStatus.hpp
/// @brief Per-player connection record shared between peers.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/core/Frame.hpp>

namespace rwn::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @struct ConnectionStatus
/// @brief Whether a player left the match, and the newest frame of theirs
///        known to be confirmed.
// /////////////////////////////////////////////////////////////////////////////
struct ConnectionStatus
{
    bool        disconnected{false};
    core::Frame lastFrame{};

    bool operator==(const ConnectionStatus &) const noexcept = default;
};

} // namespace rwn::net::netcode
