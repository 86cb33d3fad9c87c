// /////////////////////////////////////////////////////////////////////////////
/// @file SyncLayer.hpp
/// @brief Frame bookkeeping shared by every session type.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/netcode/ConnectionStatus.hpp>
#include <rwn/net/netcode/GameInput.hpp>
#include <rwn/net/netcode/InputQueue.hpp>
#include <rwn/net/netcode/SavedStateRing.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/Frame.hpp>
#include <rwn/core/NonCopyable.hpp>

#include <memory>
#include <span>
#include <vector>

namespace rwn::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @class SyncLayer
/// @brief Owns the input queues and the snapshot ring of a session.
///
/// Tracks the current, last confirmed and last saved frames, enforces the
/// prediction barrier on local input and the rollback window on loads.
/// Host callbacks are not invoked here; the owning session drives them.
// /////////////////////////////////////////////////////////////////////////////
class SyncLayer final : public core::NonCopyable<SyncLayer>
{
public:
    SyncLayer(core::u32 numPlayers,
              core::u32 maxPrediction,
              core::u32 inputSize,
              core::u32 queueLength,
              std::shared_ptr<const IPredictionStrategy> predictor);

    [[nodiscard]] core::Frame currentFrame()       const noexcept { return currentFrame_; }
    [[nodiscard]] core::Frame lastConfirmedFrame() const noexcept { return lastConfirmedFrame_; }
    [[nodiscard]] core::Frame lastSavedFrame()     const noexcept { return lastSavedFrame_; }
    [[nodiscard]] core::u32   numPlayers()         const noexcept { return static_cast<core::u32>(queues_.size()); }
    [[nodiscard]] core::u32   maxPrediction()      const noexcept { return maxPrediction_; }

    /// @brief Moves to the next frame.
    void advanceFrame() noexcept;

    /// @brief Stores the snapshot of the current frame.
    [[nodiscard]] core::Expected<void> saveCurrentState(std::vector<core::byte> buffer, core::u64 checksum);

    /// @brief Rewinds to @p frame and returns its snapshot for the host to load.
    /// @return kInvalidRequest when @p frame is not in the past,
    ///         kPredictionWindowExceeded when it is older than the window,
    ///         kFrameTooOld / kNotFound when no snapshot is available.
    [[nodiscard]] core::Expected<const SavedState *> loadFrame(core::Frame frame);

    /// @brief Snapshot of @p frame if still retained.
    [[nodiscard]] const SavedState *savedState(core::Frame frame) const noexcept;

    [[nodiscard]] core::Expected<void> setFrameDelay(core::PlayerHandle player, core::u32 delay);

    /// @brief Clears outstanding predictions on every queue (start of replay).
    void resetPrediction() noexcept;

    /// @brief Adds a local input for the current frame.
    /// @return The frame it was queued at, kPredictionThreshold when the
    ///         session is too far ahead of its confirmed frame.
    [[nodiscard]] core::Expected<core::Frame> addLocalInput(core::PlayerHandle player, const GameInput &input);

    /// @brief Adds a confirmed remote input.
    [[nodiscard]] core::Expected<core::Frame> addRemoteInput(core::PlayerHandle player, const GameInput &input);

    /// @brief Inputs of every player for the current frame.
    [[nodiscard]] core::Expected<std::vector<PlayerFrameInput>> synchronizedInputs(
        std::span<const ConnectionStatus> statuses);

    /// @brief Real inputs of every player for a confirmed @p frame.
    ///
    /// Players disconnected before @p frame report their frozen input.
    /// @return kNotFound once the queue no longer retains @p frame.
    [[nodiscard]] core::Expected<std::vector<PlayerFrameInput>> confirmedInputs(
        core::Frame frame, std::span<const ConnectionStatus> statuses) const;

    /// @brief Raises the confirmed frame and discards input history before it.
    /// @param keepFromLastSaved Never discard past the last saved frame, so a
    ///        rollback to it can still replay (sparse saving).
    void setLastConfirmedFrame(core::Frame frame, bool keepFromLastSaved = false);

    /// @brief Earliest frame whose prediction proved wrong, or null.
    /// @param firstIncorrect Extra candidate (e.g. a disconnect frame).
    [[nodiscard]] core::Frame checkSimulationConsistency(core::Frame firstIncorrect = core::Frame::null()) const noexcept;

    /// @brief Read-only access to a player's queue.
    [[nodiscard]] const InputQueue &inputQueue(core::PlayerHandle player) const;

private:
    [[nodiscard]] core::Expected<void> checkPlayer(core::PlayerHandle player) const;

    core::u32               maxPrediction_;
    std::vector<InputQueue> queues_;
    SavedStateRing          savedStates_;

    core::Frame currentFrame_{0};
    core::Frame lastConfirmedFrame_{};
    core::Frame lastSavedFrame_{};
};

} // namespace rwn::net::netcode
