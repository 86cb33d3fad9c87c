// /////////////////////////////////////////////////////////////////////////////
/// @file SessionEvent.hpp
/// @brief Notifications a session hands to its host.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/transport/PeerAddress.hpp>
#include <rwn/core/Frame.hpp>
#include <rwn/core/Types.hpp>

#include <variant>

namespace rwn::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @enum SessionState
/// @brief Whether the session may advance frames yet.
// /////////////////////////////////////////////////////////////////////////////
enum class SessionState : core::u8
{
    Synchronizing,
    Running
};

namespace event {

/// @brief Handshake progress with one endpoint.
struct Synchronizing
{
    transport::PeerAddress address;
    core::u32              total{0};
    core::u32              count{0};
};

struct Synchronized
{
    transport::PeerAddress address;
};

/// @brief Session finished its handshakes and starts at frame 0.
struct Running
{};

struct Disconnected
{
    transport::PeerAddress address;
};

struct NetworkInterrupted
{
    transport::PeerAddress address;
    core::u64              disconnectTimeoutMs{0};
};

struct NetworkResumed
{
    transport::PeerAddress address;
};

struct SyncTimeout
{
    transport::PeerAddress address;
    core::u64              elapsedMs{0};
};

/// @brief The local simulation runs ahead; idling @c skipFrames frames
///        lets the slowest peer catch up.
struct WaitRecommendation
{
    core::u32 skipFrames{0};
};

/// @brief A confirmed frame hashed differently on a remote peer. Fatal.
struct DesyncDetected
{
    core::Frame            frame{};
    core::u64              localChecksum{0};
    core::u64              remoteChecksum{0};
    transport::PeerAddress address;
};

} // namespace event

using SessionEvent = std::variant<event::Synchronizing,
                                  event::Synchronized,
                                  event::Running,
                                  event::Disconnected,
                                  event::NetworkInterrupted,
                                  event::NetworkResumed,
                                  event::SyncTimeout,
                                  event::WaitRecommendation,
                                  event::DesyncDetected>;

} // namespace rwn::net::session
