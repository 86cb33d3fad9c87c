// /////////////////////////////////////////////////////////////////////////////
/// @file SyncTestSession.hpp
/// @brief Single-process determinism check through forced rollbacks.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/netcode/ConnectionStatus.hpp>
#include <rwn/net/netcode/GameInput.hpp>
#include <rwn/net/netcode/SyncLayer.hpp>
#include <rwn/net/session/SessionCallbacks.hpp>
#include <rwn/net/session/SessionConfig.hpp>
#include <rwn/core/Concepts.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/NonCopyable.hpp>

#include <map>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace rwn::net::session {

// /////////////////////////////////////////////////////////////////////////////
/// @class SyncTestSession
/// @brief Every player is local. Each advance past @c checkDistance rolls
///        back that many frames, replays them and compares the resulting
///        checksums with those recorded the first time through.
///
/// The host drives it exactly like a P2PSession, so the same game loop can
/// be tested without a network.
// /////////////////////////////////////////////////////////////////////////////
class SyncTestSession final : public core::NonCopyable<SyncTestSession>
{
public:
    /// @return kInvalidConfig when a player is remote, a state callback is
    ///         missing, or checkDistance is not in [1, maxPrediction).
    [[nodiscard]] static core::Expected<std::unique_ptr<SyncTestSession>> create(SessionConfig config,
                                                                                SessionCallbacks callbacks);

    [[nodiscard]] core::Expected<void> addLocalInput(core::PlayerHandle handle,
                                                     core::Frame frame,
                                                     std::span<const core::byte> bytes);

    template <core::Blittable T>
    [[nodiscard]] core::Expected<void> addLocalInput(core::PlayerHandle handle, core::Frame frame, const T &input)
    {
        return addLocalInput(handle, frame, std::as_bytes(std::span{&input, 1}));
    }

    [[nodiscard]] core::Expected<std::vector<netcode::PlayerFrameInput>> synchronizeInputs();

    /// @brief Completes the frame, then performs the forced rollback.
    /// @return kMismatchedChecksum naming the frames whose replay diverged.
    [[nodiscard]] core::Expected<core::Frame> advanceFrame(std::optional<core::u64> checksum = std::nullopt);

    [[nodiscard]] core::Expected<core::Frame> simulateFrame();

    [[nodiscard]] core::Frame currentFrame() const noexcept { return syncLayer_.currentFrame(); }
    [[nodiscard]] bool        isReplaying()  const noexcept { return replaying_; }
    [[nodiscard]] core::u32   checkDistance() const noexcept { return config_.checkDistance(); }

private:
    SyncTestSession(SessionConfig config, SessionCallbacks callbacks);

    [[nodiscard]] core::Expected<void> checkFatal() const;
    [[nodiscard]] core::Expected<void> requireInputs() const;
    core::Expected<void> latch(core::Expected<void> result);

    /// @brief Saves the current frame and returns its host-side checksum.
    [[nodiscard]] core::Expected<core::u64> saveCurrentState(std::optional<core::u64> checksum);
    [[nodiscard]] core::Expected<void> verifyByReplay();

    SessionConfig      config_;
    SessionCallbacks   callbacks_;
    netcode::SyncLayer syncLayer_;

    std::vector<netcode::ConnectionStatus>         statuses_;
    std::vector<std::optional<netcode::GameInput>> pending_;
    std::map<core::Frame, core::u64>               checksumHistory_;
    std::optional<core::Error>                     fatal_;
    bool                                           replaying_{false};
};

} // namespace rwn::net::session
