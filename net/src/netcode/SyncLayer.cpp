/**
 * @file SyncLayer.cpp
 * @brief SyncLayer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/netcode/SyncLayer.hpp>
#include <rwn/core/Log.hpp>

#include <algorithm>
#include <format>

namespace rwn::net::netcode {

SyncLayer::SyncLayer(core::u32 numPlayers,
                     core::u32 maxPrediction,
                     core::u32 inputSize,
                     core::u32 queueLength,
                     std::shared_ptr<const IPredictionStrategy> predictor)
    : maxPrediction_{maxPrediction}
    , savedStates_{maxPrediction}
{
    queues_.reserve(numPlayers);
    for (core::u32 i = 0; i < numPlayers; ++i)
        queues_.emplace_back(i, inputSize, queueLength, predictor);
}

void SyncLayer::advanceFrame() noexcept
{
    ++currentFrame_;
}

core::Expected<void> SyncLayer::saveCurrentState(std::vector<core::byte> buffer, core::u64 checksum)
{
    RWN_TRY_VOID(savedStates_.save(currentFrame_, std::move(buffer), checksum));
    lastSavedFrame_ = currentFrame_;
    return {};
}

core::Expected<const SavedState *> SyncLayer::loadFrame(core::Frame frame)
{
    if (!frame.isValid() || frame >= currentFrame_)
    {
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("cannot roll back to frame {} from frame {}",
                                           frame.value(), currentFrame_.value()));
    }

    if (frame < currentFrame_ - static_cast<core::i32>(maxPrediction_))
    {
        core::Log::error("SyncLayer", std::format("rollback to frame {} exceeds the {}-frame window at frame {}",
                                                  frame.value(), maxPrediction_, currentFrame_.value()));
        return core::makeError(core::ErrorCode::kPredictionWindowExceeded,
                               std::format("frame {} is older than the rollback window", frame.value()));
    }

    const SavedState *state = RWN_TRY(savedStates_.load(frame));

    currentFrame_   = frame;
    lastSavedFrame_ = frame;
    savedStates_.invalidateAfter(frame);
    return state;
}

const SavedState *SyncLayer::savedState(core::Frame frame) const noexcept
{
    return savedStates_.find(frame);
}

core::Expected<void> SyncLayer::checkPlayer(core::PlayerHandle player) const
{
    if (!player.isValidFor(numPlayers()))
    {
        return core::makeError(core::ErrorCode::kInvalidPlayer,
                               std::format("player {} out of range", player.index()));
    }
    return {};
}

core::Expected<void> SyncLayer::setFrameDelay(core::PlayerHandle player, core::u32 delay)
{
    RWN_TRY_VOID(checkPlayer(player));
    return queues_[player.index()].setFrameDelay(delay);
}

void SyncLayer::resetPrediction() noexcept
{
    for (InputQueue &queue : queues_)
        queue.resetPrediction();
}

core::Expected<core::Frame> SyncLayer::addLocalInput(core::PlayerHandle player, const GameInput &input)
{
    RWN_TRY_VOID(checkPlayer(player));

    const core::i32 framesBehind = currentFrame_ - lastConfirmedFrame_;
    if (currentFrame_.value() >= static_cast<core::i32>(maxPrediction_)
        && framesBehind >= static_cast<core::i32>(maxPrediction_))
    {
        core::Log::debug("SyncLayer", std::format("prediction barrier reached at frame {}", currentFrame_.value()));
        return core::makeError(core::ErrorCode::kPredictionThreshold,
                               std::format("{} frames ahead of the last confirmed frame", framesBehind));
    }

    if (input.frame != currentFrame_)
    {
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("local input for frame {} while at frame {}",
                                           input.frame.value(), currentFrame_.value()));
    }

    return queues_[player.index()].addInput(input);
}

core::Expected<core::Frame> SyncLayer::addRemoteInput(core::PlayerHandle player, const GameInput &input)
{
    RWN_TRY_VOID(checkPlayer(player));
    return queues_[player.index()].addInput(input);
}

core::Expected<std::vector<PlayerFrameInput>> SyncLayer::synchronizedInputs(
    std::span<const ConnectionStatus> statuses)
{
    if (statuses.size() != queues_.size())
    {
        return core::makeError(core::ErrorCode::kInternalError,
                               std::format("{} connection records for {} players", statuses.size(), queues_.size()));
    }

    std::vector<PlayerFrameInput> inputs;
    inputs.reserve(queues_.size());

    for (core::u32 i = 0; i < queues_.size(); ++i)
    {
        const ConnectionStatus &status = statuses[i];
        if (status.disconnected && status.lastFrame < currentFrame_)
        {
            GameInput frozen = queues_[i].frozenInput(status.lastFrame);
            frozen.frame = currentFrame_;
            inputs.push_back({core::PlayerHandle{i}, frozen, InputStatus::Disconnected});
            continue;
        }

        auto [input, inputStatus] = RWN_TRY(queues_[i].input(currentFrame_));
        inputs.push_back({core::PlayerHandle{i}, input, inputStatus});
    }
    return inputs;
}

core::Expected<std::vector<PlayerFrameInput>> SyncLayer::confirmedInputs(
    core::Frame frame, std::span<const ConnectionStatus> statuses) const
{
    if (statuses.size() != queues_.size())
    {
        return core::makeError(core::ErrorCode::kInternalError,
                               std::format("{} connection records for {} players", statuses.size(), queues_.size()));
    }

    std::vector<PlayerFrameInput> inputs;
    inputs.reserve(queues_.size());

    for (core::u32 i = 0; i < queues_.size(); ++i)
    {
        const ConnectionStatus &status = statuses[i];
        if (status.disconnected && status.lastFrame < frame)
        {
            GameInput frozen = queues_[i].frozenInput(status.lastFrame);
            frozen.frame = frame;
            inputs.push_back({core::PlayerHandle{i}, frozen, InputStatus::Disconnected});
            continue;
        }

        const GameInput input = RWN_TRY(queues_[i].confirmedInput(frame));
        inputs.push_back({core::PlayerHandle{i}, input, InputStatus::Confirmed});
    }
    return inputs;
}

void SyncLayer::setLastConfirmedFrame(core::Frame frame, bool keepFromLastSaved)
{
    if (frame.isNull())
        return;

    frame = std::min(frame, currentFrame_);
    if (keepFromLastSaved && !lastSavedFrame_.isNull())
        frame = std::min(frame, lastSavedFrame_);

    const core::Frame firstIncorrect = checkSimulationConsistency();
    if (!firstIncorrect.isNull())
        frame = std::min(frame, firstIncorrect);

    if (frame <= lastConfirmedFrame_)
        return;

    lastConfirmedFrame_ = frame;
    if (frame.value() > 0)
    {
        for (InputQueue &queue : queues_)
            queue.confirmUpTo(frame - 1);
    }
}

core::Frame SyncLayer::checkSimulationConsistency(core::Frame firstIncorrect) const noexcept
{
    for (const InputQueue &queue : queues_)
    {
        const core::Frame incorrect = queue.firstIncorrectFrame();
        if (!incorrect.isNull() && (firstIncorrect.isNull() || incorrect < firstIncorrect))
            firstIncorrect = incorrect;
    }
    return firstIncorrect;
}

const InputQueue &SyncLayer::inputQueue(core::PlayerHandle player) const
{
    return queues_.at(player.index());
}

} // namespace rwn::net::netcode
