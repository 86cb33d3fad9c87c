/**
 * @file SyncTestSession.cpp
 * @brief SyncTestSession implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/session/SyncTestSession.hpp>
#include <rwn/math/StateHash.hpp>
#include <rwn/core/Log.hpp>

#include <algorithm>
#include <format>
#include <string>

namespace rwn::net::session {

namespace {

constexpr std::string_view kTag = "SyncTest";

} // namespace

core::Expected<std::unique_ptr<SyncTestSession>> SyncTestSession::create(SessionConfig config,
                                                                         SessionCallbacks callbacks)
{
    if (!callbacks.complete())
        return core::makeError(core::ErrorCode::kInvalidConfig, "saveState, loadState and advanceFrame are required");
    if (!config.remoteEndpoints().empty())
        return core::makeError(core::ErrorCode::kInvalidConfig, "every player of a sync test is local");
    if (config.checkDistance() < 1 || config.checkDistance() >= config.maxPrediction())
    {
        return core::makeError(core::ErrorCode::kInvalidConfig,
                               std::format("checkDistance {} must be in [1, {})", config.checkDistance(),
                                           config.maxPrediction()));
    }

    auto session = std::unique_ptr<SyncTestSession>(new SyncTestSession(std::move(config), std::move(callbacks)));
    core::Log::info(kTag, std::format("checking {} players, rolling back {} frames each tick",
                                      session->config_.numPlayers(), session->config_.checkDistance()));
    return session;
}

SyncTestSession::SyncTestSession(SessionConfig config, SessionCallbacks callbacks)
    : config_(std::move(config))
    , callbacks_(std::move(callbacks))
    , syncLayer_(config_.numPlayers(), config_.maxPrediction(), config_.inputSize(), config_.queueLength(),
                 config_.predictionStrategy())
    , statuses_(config_.numPlayers())
    , pending_(config_.numPlayers())
{
    for (core::u32 i = 0; i < config_.numPlayers(); ++i)
    {
        if (auto delayed = syncLayer_.setFrameDelay(core::PlayerHandle{i}, config_.inputDelay()); !delayed)
            core::Log::warn(kTag, delayed.error().describe());
    }
}

core::Expected<void> SyncTestSession::checkFatal() const
{
    if (fatal_)
        return std::unexpected(*fatal_);
    return {};
}

core::Expected<void> SyncTestSession::requireInputs() const
{
    for (core::u32 i = 0; i < pending_.size(); ++i)
    {
        if (!pending_[i])
        {
            return core::makeError(core::ErrorCode::kInvalidRequest,
                                   std::format("no input from player {} for frame {}", i,
                                               syncLayer_.currentFrame().value()));
        }
    }
    return {};
}

core::Expected<void> SyncTestSession::latch(core::Expected<void> result)
{
    if (!result && result.error().fatal() && !fatal_)
    {
        core::Log::error(kTag, result.error().describe());
        fatal_ = result.error();
    }
    return result;
}

core::Expected<void> SyncTestSession::addLocalInput(core::PlayerHandle handle,
                                                    core::Frame frame,
                                                    std::span<const core::byte> bytes)
{
    RWN_TRY_VOID(checkFatal());
    RWN_TRY(core::PlayerHandle::create(handle.index(), config_.numPlayers()));

    const core::Frame current = syncLayer_.currentFrame();
    if (frame < current)
        return core::makeError(core::ErrorCode::kFrameTooOld,
                               std::format("input for frame {} while at frame {}", frame.value(), current.value()));
    if (frame > current)
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("input for future frame {} while at frame {}", frame.value(), current.value()));
    if (bytes.size() != config_.inputSize())
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("input of {} bytes, expected {}", bytes.size(), config_.inputSize()));
    if (pending_[handle.index()])
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("player {} already has input for frame {}", handle.index(), frame.value()));

    if (syncLayer_.lastSavedFrame().isNull())
    {
        const core::u64 checksum = RWN_TRY(saveCurrentState(std::nullopt));
        checksumHistory_.try_emplace(current, checksum);
    }

    const auto input = RWN_TRY(netcode::GameInput::fromBytes(frame, bytes));
    const core::Frame actual = RWN_TRY(syncLayer_.addLocalInput(handle, input));
    statuses_[handle.index()].lastFrame = actual;
    pending_[handle.index()] = input;
    return {};
}

core::Expected<std::vector<netcode::PlayerFrameInput>> SyncTestSession::synchronizeInputs()
{
    RWN_TRY_VOID(checkFatal());
    RWN_TRY_VOID(requireInputs());
    return syncLayer_.synchronizedInputs(statuses_);
}

core::Expected<core::u64> SyncTestSession::saveCurrentState(std::optional<core::u64> checksum)
{
    const core::Frame frame = syncLayer_.currentFrame();
    SavedStateData data = callbacks_.saveState(frame);
    const core::u64 intrinsic = data.checksum.has_value() ? *data.checksum : math::StateHash::of(data.bytes);
    RWN_TRY_VOID(syncLayer_.saveCurrentState(std::move(data.bytes), checksum.value_or(intrinsic)));
    return intrinsic;
}

core::Expected<core::Frame> SyncTestSession::advanceFrame(std::optional<core::u64> checksum)
{
    RWN_TRY_VOID(checkFatal());
    RWN_TRY_VOID(requireInputs());

    syncLayer_.advanceFrame();
    const core::u64 intrinsic = RWN_TRY(saveCurrentState(checksum));
    checksumHistory_.try_emplace(syncLayer_.currentFrame(), intrinsic);
    std::ranges::fill(pending_, std::nullopt);

    const core::Frame current = syncLayer_.currentFrame();
    if (current.value() > static_cast<core::i32>(config_.checkDistance()))
        RWN_TRY_VOID(latch(verifyByReplay()));

    syncLayer_.setLastConfirmedFrame(current - static_cast<core::i32>(config_.checkDistance()));
    return current;
}

core::Expected<void> SyncTestSession::verifyByReplay()
{
    const core::Frame current = syncLayer_.currentFrame();
    const core::Frame seekTo = current - static_cast<core::i32>(config_.checkDistance());

    const netcode::SavedState *state = RWN_TRY(syncLayer_.loadFrame(seekTo));
    callbacks_.loadState(state->frame, state->buffer);
    syncLayer_.resetPrediction();

    std::vector<core::Frame> mismatches;
    replaying_ = true;
    while (syncLayer_.currentFrame() < current)
    {
        auto inputs = syncLayer_.synchronizedInputs(statuses_);
        if (!inputs)
        {
            replaying_ = false;
            return std::unexpected(std::move(inputs.error()));
        }
        callbacks_.advanceFrame(*inputs, true);
        syncLayer_.advanceFrame();

        auto replayed = saveCurrentState(std::nullopt);
        if (!replayed)
        {
            replaying_ = false;
            return std::unexpected(std::move(replayed.error()));
        }
        const auto recorded = checksumHistory_.find(syncLayer_.currentFrame());
        if (recorded != checksumHistory_.end() && recorded->second != *replayed)
        {
            core::Log::error(kTag, std::format("frame {}: recorded {:#018x}, replayed {:#018x}",
                                               recorded->first.value(), recorded->second, *replayed));
            mismatches.push_back(recorded->first);
        }
    }
    replaying_ = false;

    checksumHistory_.erase(checksumHistory_.begin(), checksumHistory_.lower_bound(seekTo));

    if (!mismatches.empty())
    {
        std::string frames;
        for (const auto frame : mismatches)
            frames += std::format("{}{}", frames.empty() ? "" : ", ", frame.value());
        return core::makeError(core::ErrorCode::kMismatchedChecksum,
                               std::format("replay diverged at frames {}", frames));
    }
    return {};
}

core::Expected<core::Frame> SyncTestSession::simulateFrame()
{
    const auto inputs = RWN_TRY(synchronizeInputs());
    callbacks_.advanceFrame(inputs, false);
    return advanceFrame(std::nullopt);
}

} // namespace rwn::net::session
