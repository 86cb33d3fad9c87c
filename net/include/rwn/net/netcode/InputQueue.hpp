// /////////////////////////////////////////////////////////////////////////////
/// @file InputQueue.hpp
/// @brief Per-player ring of confirmed inputs with memoised prediction.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/net/netcode/GameInput.hpp>
#include <rwn/net/netcode/IPredictionStrategy.hpp>
#include <rwn/core/Constants.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/Frame.hpp>

#include <memory>
#include <utility>
#include <vector>

namespace rwn::net::netcode {

// /////////////////////////////////////////////////////////////////////////////
/// @class InputQueue
/// @brief Frame-indexed ring buffer of one player's inputs.
///
/// Real inputs are appended in frame order (shifted by the frame delay).
/// Requests past the newest real input are answered by a prediction that
/// stays fixed until real input replaces it; the first frame whose real
/// input disagrees with the prediction is reported by
/// firstIncorrectFrame() so the session can roll back to it.
// /////////////////////////////////////////////////////////////////////////////
class InputQueue final
{
public:
    /// @param playerIndex Owning player (for diagnostics).
    /// @param inputSize   Payload size of every input.
    /// @param queueLength Ring capacity, in frames.
    /// @param predictor   Prediction strategy; defaults to RepeatLastConfirmed.
    InputQueue(core::u32 playerIndex,
               core::u32 inputSize,
               core::u32 queueLength = core::kDefaultQueueLength,
               std::shared_ptr<const IPredictionStrategy> predictor = nullptr);

    /// @brief Sets the delay applied to inputs added from now on.
    /// @return kInvalidRequest if @p delay does not fit in the ring.
    [[nodiscard]] core::Expected<void> setFrameDelay(core::u32 delay);

    [[nodiscard]] core::u32   frameDelay()          const noexcept { return frameDelay_; }
    [[nodiscard]] core::Frame firstIncorrectFrame() const noexcept { return firstIncorrectFrame_; }
    [[nodiscard]] core::Frame lastAddedFrame()      const noexcept { return lastAddedFrame_; }
    [[nodiscard]] core::Frame confirmedFrame()      const noexcept { return confirmedFrame_; }
    [[nodiscard]] core::u32   length()              const noexcept { return length_; }

    /// @brief Oldest frame still retained (null when empty).
    [[nodiscard]] core::Frame oldestFrame() const noexcept;

    /// @brief Appends a confirmed input.
    /// @return The frame the input was stored at (input frame + delay), or
    ///         kFrameTooOld for stale/duplicate input, kInvalidRequest for a
    ///         gap or wrong payload size, kInputBufferFull when the ring
    ///         has no room.
    [[nodiscard]] core::Expected<core::Frame> addInput(const GameInput &input);

    /// @brief Input for @p frame, real or predicted.
    /// @return kFrameTooOld if @p frame was already discarded,
    ///         kInvalidState while a prediction error is unresolved.
    [[nodiscard]] core::Expected<std::pair<GameInput, InputStatus>> input(core::Frame frame);

    /// @brief Real input for @p frame, kNotFound if absent.
    [[nodiscard]] core::Expected<GameInput> confirmedInput(core::Frame frame) const;

    /// @brief Last real input at or before @p lastFrame, or a blank input.
    [[nodiscard]] GameInput frozenInput(core::Frame lastFrame) const;

    /// @brief Marks every entry up to @p frame immutable and drops older history.
    ///
    /// The confirmed frame never moves backwards; entries at or after the
    /// last requested frame are always retained.
    void confirmUpTo(core::Frame frame);

    /// @brief Forgets the outstanding prediction and any detected mismatch.
    void resetPrediction() noexcept;

    /// @brief All retained real inputs, in strictly increasing frame order.
    [[nodiscard]] std::vector<GameInput> confirmedEntries() const;

private:
    [[nodiscard]] core::u32 previousSlot(core::u32 slot) const noexcept;
    void pushEntry(const GameInput &input, core::Frame frame);

    core::u32                                  playerIndex_;
    core::u32                                  inputSize_;
    core::u32                                  queueLength_;
    std::shared_ptr<const IPredictionStrategy> predictor_;

    std::vector<GameInput> inputs_;
    core::u32              head_{0};
    core::u32              tail_{0};
    core::u32              length_{0};
    core::u32              frameDelay_{0};

    core::Frame lastUserAddedFrame_{};
    core::Frame lastAddedFrame_{};
    core::Frame firstIncorrectFrame_{};
    core::Frame lastRequestedFrame_{};
    core::Frame confirmedFrame_{};

    GameInput prediction_{};
};

} // namespace rwn::net::netcode
