// /////////////////////////////////////////////////////////////////////////////
/// @file P2PSession.hpp
/// @brief Peer-to-peer rollback session.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/netcode/ConnectionStatus.hpp>
#include <rwn/net/netcode/GameInput.hpp>
#include <rwn/net/netcode/SyncLayer.hpp>
#include <rwn/net/protocol/PeerProtocol.hpp>
#include <rwn/net/session/SessionCallbacks.hpp>
#include <rwn/net/session/SessionConfig.hpp>
#include <rwn/net/session/SessionEvent.hpp>
#include <rwn/net/transport/ITransport.hpp>
#include <rwn/core/Clock.hpp>
#include <rwn/core/Concepts.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/NonCopyable.hpp>

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace rwn::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class P2PSession
/// @brief Runs a match between local players and remote endpoints,
///        predicting missing remote input and rolling back on mispredictions.
///
/// Per tick the host calls, in order:
///   1. @ref addLocalInput for every local player,
///   2. @ref synchronizeInputs and simulates one frame with the result,
///   3. @ref advanceFrame.
/// (@ref simulateFrame performs 2 and 3 through the advance callback.)
/// Rollbacks re-enter the host through SessionCallbacks with
/// @c replay == true. Fatal errors (desync, rollback window overrun) are
/// latched: every later frame operation returns the same error.
// /////////////////////////////////////////////////////////////////////////////
class P2PSession final : public core::NonCopyable<P2PSession>
{
public:
    /// @brief Validates @p config against this session type and opens @p transport.
    /// @return kInvalidConfig when a handle is unregistered, no player is
    ///         local or a state callback is missing; transport errors as is.
    [[nodiscard]] static core::Expected<std::unique_ptr<P2PSession>> create(SessionConfig config,
                                                                           transport::ITransport &transport,
                                                                           const core::IClock &clock,
                                                                           SessionCallbacks callbacks);

    /// @brief Submits a local player's input for @p frame (the current frame).
    /// @return kPredictionThreshold when too far ahead of the remote peers;
    ///         the host should skip this tick and keep polling.
    [[nodiscard]] core::Expected<void> addLocalInput(core::PlayerHandle handle,
                                                     core::Frame frame,
                                                     std::span<const core::byte> bytes);

    template <core::Blittable T>
    [[nodiscard]] core::Expected<void> addLocalInput(core::PlayerHandle handle, core::Frame frame, const T &input)
    {
        return addLocalInput(handle, frame, std::as_bytes(std::span{&input, 1}));
    }

    /// @brief Inputs of every player for the current frame, after any
    ///        pending rollback was performed.
    [[nodiscard]] core::Expected<std::vector<netcode::PlayerFrameInput>> synchronizeInputs();

    /// @brief Completes the current frame.
    /// @param checksum Checksum of the new state, overriding the host's.
    /// @return The new current frame.
    [[nodiscard]] core::Expected<core::Frame> advanceFrame(std::optional<core::u64> checksum = std::nullopt);

    /// @brief synchronizeInputs, the host advance callback, then advanceFrame.
    [[nodiscard]] core::Expected<core::Frame> simulateFrame();

    /// @brief Network progress without advancing a frame.
    [[nodiscard]] core::Expected<void> poll();

    /// @brief Drops a remote player; its input stays frozen at its last
    ///        confirmed value.
    [[nodiscard]] core::Expected<void> disconnectPlayer(core::PlayerHandle handle);

    /// @brief Delays local input by @p delay frames. Local input travels in
    ///        one datagram, so the delay applies to every local player and
    ///        can only change before the first input.
    [[nodiscard]] core::Expected<void> setFrameDelay(core::PlayerHandle handle, core::u32 delay);

    [[nodiscard]] core::Expected<protocol::NetworkStats> networkStats(core::PlayerHandle handle) const;

    /// @brief Inputs every peer agreed on for @p frame, for replays and
    ///        server-side validation.
    /// @return kInvalidRequest for a frame not confirmed yet; kNotFound once
    ///         the frame left the input queues.
    [[nodiscard]] core::Expected<std::vector<netcode::PlayerFrameInput>> confirmedInputsForFrame(core::Frame frame) const;

    /// @brief Events queued since the last call (only when no onEvent callback is set).
    [[nodiscard]] std::vector<SessionEvent> drainEvents();

    [[nodiscard]] core::Frame  currentFrame()   const noexcept { return syncLayer_.currentFrame(); }
    [[nodiscard]] core::Frame  confirmedFrame() const noexcept { return syncLayer_.lastConfirmedFrame(); }
    [[nodiscard]] SessionState state()          const noexcept { return state_; }
    [[nodiscard]] bool         isReplaying()    const noexcept { return replaying_; }

    /// @brief Largest averaged frame advantage over the running peers.
    [[nodiscard]] core::i32 framesAhead() const noexcept;

    [[nodiscard]] const SessionConfig &config() const noexcept { return config_; }

private:
    P2PSession(SessionConfig config,
               transport::ITransport &transport,
               const core::IClock &clock,
               SessionCallbacks callbacks);

    [[nodiscard]] core::Expected<void> checkFatal() const;
    [[nodiscard]] core::Expected<void> checkRunning() const;
    [[nodiscard]] core::Expected<void> requireLocalInputs() const;
    core::Expected<void> latch(core::Expected<void> result);

    [[nodiscard]] core::Expected<void> saveCurrentState(std::optional<core::u64> checksum);
    [[nodiscard]] core::Expected<void> rollbackIfNeeded(bool resetAtCurrent);
    [[nodiscard]] core::Expected<void> adjustSimulation(core::Frame seekTo);
    [[nodiscard]] core::Expected<void> checkLastSavedState();
    [[nodiscard]] core::Expected<void> doPoll();

    void sendLocalInputs(core::Frame frame);
    void pollRemote();
    void flushEndpoints();
    void handlePeerEvent(core::usize endpoint, protocol::PeerEvent &peerEvent);
    void handleRemoteInput(core::usize endpoint, const protocol::event::Input &input);
    void checkInitialSync();
    void updatePlayerDisconnects();
    void disconnectPlayerAtFrame(core::PlayerHandle handle, core::Frame lastFrame);
    void freezePlayerInput(core::PlayerHandle handle, core::Frame lastFrame);
    [[nodiscard]] core::Frame minConfirmedFrame() const;
    void sendChecksums();
    [[nodiscard]] core::Expected<void> compareChecksums();
    void checkWaitRecommendation();
    void pushEvent(SessionEvent event);

    [[nodiscard]] protocol::PeerProtocol *endpointFor(const transport::PeerAddress &address) noexcept;

    SessionConfig          config_;
    transport::ITransport &transport_;
    const core::IClock    &clock_;
    SessionCallbacks       callbacks_;
    netcode::SyncLayer     syncLayer_;

    std::vector<std::unique_ptr<protocol::PeerProtocol>> endpoints_;
    std::vector<std::optional<core::usize>>              endpointOfPlayer_;
    std::vector<core::PlayerHandle>                      localHandles_;
    std::vector<netcode::ConnectionStatus>               localConnectStatus_;
    std::vector<std::optional<netcode::GameInput>>       pendingLocal_;

    SessionState               state_{SessionState::Synchronizing};
    std::optional<core::Error> fatal_;
    bool                       replaying_{false};
    core::Frame                disconnectFrame_{};
    core::Frame                nextRecommendedSleep_{0};
    core::Frame                lastSentChecksumFrame_{};
    std::map<core::Frame, core::u64> localChecksumHistory_;
    std::deque<SessionEvent>   events_;
};

} // namespace rwn::net::session
