/**
 * @file P2PSession.cpp
 * @brief P2PSession implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/session/P2PSession.hpp>
#include <rwn/math/StateHash.hpp>
#include <rwn/core/Log.hpp>

#include <algorithm>
#include <array>
#include <format>
#include <iterator>
#include <type_traits>
#include <variant>

namespace rwn::net::session {

namespace {

constexpr std::string_view kTag = "P2PSession";

/// Upper bound on datagrams handled per poll, so a flood cannot stall a tick.
constexpr core::usize kMaxDatagramsPerPoll = 256;

core::u64 endpointSeed(core::u64 rngSeed, const transport::PeerAddress &address, core::usize index)
{
    return (rngSeed * 0x9E3779B97F4A7C15ull) ^ (static_cast<core::u64>(address.host) << 16) ^ address.port ^
           (static_cast<core::u64>(index) << 48);
}

} // namespace

// -------------------------------------------------------------------------- //
//  Construction                                                              //
// -------------------------------------------------------------------------- //

core::Expected<std::unique_ptr<P2PSession>> P2PSession::create(SessionConfig config,
                                                               transport::ITransport &transport,
                                                               const core::IClock &clock,
                                                               SessionCallbacks callbacks)
{
    if (!callbacks.complete())
        return core::makeError(core::ErrorCode::kInvalidConfig, "saveState, loadState and advanceFrame are required");
    if (config.players().size() != config.numPlayers())
    {
        return core::makeError(core::ErrorCode::kInvalidConfig,
                               std::format("{} of {} players registered", config.players().size(), config.numPlayers()));
    }
    if (config.localHandles().empty())
        return core::makeError(core::ErrorCode::kInvalidConfig, "a session needs at least one local player");

    RWN_TRY_VOID(transport.open());

    auto session = std::unique_ptr<P2PSession>(
        new P2PSession(std::move(config), transport, clock, std::move(callbacks)));
    core::Log::info(kTag, std::format("session created: {} players, {} remote endpoints, over {}",
                                      session->config_.numPlayers(), session->endpoints_.size(), transport.name()));
    return session;
}

P2PSession::P2PSession(SessionConfig config,
                       transport::ITransport &transport,
                       const core::IClock &clock,
                       SessionCallbacks callbacks)
    : config_(std::move(config))
    , transport_(transport)
    , clock_(clock)
    , callbacks_(std::move(callbacks))
    , syncLayer_(config_.numPlayers(), config_.maxPrediction(), config_.inputSize(), config_.queueLength(),
                 config_.predictionStrategy())
    , endpointOfPlayer_(config_.numPlayers())
    , localHandles_(config_.localHandles())
    , localConnectStatus_(config_.numPlayers())
    , pendingLocal_(config_.numPlayers())
{
    for (const auto handle : localHandles_)
    {
        if (auto delayed = syncLayer_.setFrameDelay(handle, config_.inputDelay()); !delayed)
            core::Log::warn(kTag, delayed.error().describe());
    }

    for (auto &[address, handles] : config_.remoteEndpoints())
    {
        protocol::PeerProtocolParams params;
        params.handles = handles;
        params.address = address;
        params.numPlayers = config_.numPlayers();
        params.localPlayers = static_cast<core::u32>(localHandles_.size());
        params.inputSize = config_.inputSize();
        params.maxPrediction = config_.maxPrediction();
        params.fps = config_.fps();
        params.disconnectTimeoutMs = config_.disconnectTimeoutMs();
        params.disconnectNotifyStartMs = config_.disconnectNotifyStartMs();
        params.sync = config_.syncConfig();
        params.protocol = config_.protocolConfig();
        params.desync = config_.desyncDetection();
        params.seed = endpointSeed(config_.rngSeed(), address, endpoints_.size());

        for (const auto handle : handles)
            endpointOfPlayer_[handle.index()] = endpoints_.size();
        endpoints_.push_back(std::make_unique<protocol::PeerProtocol>(std::move(params), clock_));
    }

    if (endpoints_.empty())
    {
        state_ = SessionState::Running;
        return;
    }
    for (auto &endpoint : endpoints_)
        endpoint->synchronize();
    flushEndpoints();
}

// -------------------------------------------------------------------------- //
//  Guards                                                                    //
// -------------------------------------------------------------------------- //

core::Expected<void> P2PSession::checkFatal() const
{
    if (fatal_)
        return std::unexpected(*fatal_);
    return {};
}

core::Expected<void> P2PSession::checkRunning() const
{
    RWN_TRY_VOID(checkFatal());
    if (state_ != SessionState::Running)
        return core::makeError(core::ErrorCode::kNotSynchronized, "peers are still synchronizing");
    return {};
}

core::Expected<void> P2PSession::requireLocalInputs() const
{
    for (const auto handle : localHandles_)
    {
        if (!pendingLocal_[handle.index()])
        {
            return core::makeError(core::ErrorCode::kInvalidRequest,
                                   std::format("no input from local player {} for frame {}", handle.index(),
                                               syncLayer_.currentFrame().value()));
        }
    }
    return {};
}

core::Expected<void> P2PSession::latch(core::Expected<void> result)
{
    if (!result && result.error().fatal() && !fatal_)
    {
        core::Log::error(kTag, result.error().describe());
        fatal_ = result.error();
    }
    return result;
}

// -------------------------------------------------------------------------- //
//  Frame operations                                                          //
// -------------------------------------------------------------------------- //

core::Expected<void> P2PSession::addLocalInput(core::PlayerHandle handle,
                                               core::Frame frame,
                                               std::span<const core::byte> bytes)
{
    RWN_TRY_VOID(checkFatal());
    RWN_TRY(core::PlayerHandle::create(handle.index(), config_.numPlayers()));
    if (!config_.isLocal(handle))
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("player {} is not local", handle.index()));
    RWN_TRY_VOID(checkRunning());

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
    if (pendingLocal_[handle.index()])
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("player {} already has input for frame {}", handle.index(), frame.value()));

    if (syncLayer_.lastSavedFrame().isNull())
        RWN_TRY_VOID(latch(saveCurrentState(std::nullopt)));

    const auto input = RWN_TRY(netcode::GameInput::fromBytes(frame, bytes));
    const core::Frame actual = RWN_TRY(syncLayer_.addLocalInput(handle, input));
    localConnectStatus_[handle.index()].lastFrame = actual;
    pendingLocal_[handle.index()] = input;

    const bool complete = std::ranges::all_of(localHandles_, [this](core::PlayerHandle h) {
        return pendingLocal_[h.index()].has_value();
    });
    if (complete)
        sendLocalInputs(actual);
    return {};
}

void P2PSession::sendLocalInputs(core::Frame frame)
{
    std::vector<core::byte> combined;
    combined.reserve(localHandles_.size() * config_.inputSize());
    for (const auto handle : localHandles_)
    {
        const auto bytes = pendingLocal_[handle.index()]->bytes();
        combined.insert(combined.end(), bytes.begin(), bytes.end());
    }

    for (auto &endpoint : endpoints_)
    {
        endpoint->updateLocalFrameAdvantage(syncLayer_.currentFrame());
        endpoint->sendInput(frame, combined, localConnectStatus_);
    }
    flushEndpoints();
}

core::Expected<std::vector<netcode::PlayerFrameInput>> P2PSession::synchronizeInputs()
{
    RWN_TRY_VOID(checkRunning());
    RWN_TRY_VOID(requireLocalInputs());
    RWN_TRY_VOID(latch(rollbackIfNeeded(true)));
    return syncLayer_.synchronizedInputs(localConnectStatus_);
}

core::Expected<core::Frame> P2PSession::advanceFrame(std::optional<core::u64> checksum)
{
    RWN_TRY_VOID(checkRunning());
    RWN_TRY_VOID(requireLocalInputs());

    syncLayer_.advanceFrame();
    if (config_.saveMode() == SaveMode::EveryFrame)
        RWN_TRY_VOID(latch(saveCurrentState(checksum)));
    std::ranges::fill(pendingLocal_, std::nullopt);

    RWN_TRY_VOID(doPoll());
    return syncLayer_.currentFrame();
}

core::Expected<core::Frame> P2PSession::simulateFrame()
{
    const auto inputs = RWN_TRY(synchronizeInputs());
    callbacks_.advanceFrame(inputs, false);
    return advanceFrame(std::nullopt);
}

core::Expected<void> P2PSession::poll()
{
    RWN_TRY_VOID(checkFatal());
    return doPoll();
}

// -------------------------------------------------------------------------- //
//  Rollback                                                                  //
// -------------------------------------------------------------------------- //

core::Expected<void> P2PSession::saveCurrentState(std::optional<core::u64> checksum)
{
    const core::Frame frame = syncLayer_.currentFrame();
    SavedStateData data = callbacks_.saveState(frame);
    const core::u64 effective = checksum.has_value()      ? *checksum
                              : data.checksum.has_value() ? *data.checksum
                                                          : math::StateHash::of(data.bytes);
    return syncLayer_.saveCurrentState(std::move(data.bytes), effective);
}

core::Expected<void> P2PSession::rollbackIfNeeded(bool resetAtCurrent)
{
    const core::Frame current = syncLayer_.currentFrame();
    const core::Frame firstIncorrect = syncLayer_.checkSimulationConsistency(disconnectFrame_);
    if (firstIncorrect.isNull())
        return {};

    if (firstIncorrect < current)
    {
        RWN_TRY_VOID(adjustSimulation(firstIncorrect));
        disconnectFrame_ = core::Frame::null();
    }
    else if (firstIncorrect == current && resetAtCurrent)
    {
        // Nothing simulated with the wrong input yet; drop the stale guess.
        syncLayer_.resetPrediction();
        disconnectFrame_ = core::Frame::null();
    }
    return {};
}

core::Expected<void> P2PSession::adjustSimulation(core::Frame seekTo)
{
    const bool sparse = config_.saveMode() == SaveMode::Sparse;
    const core::Frame current = syncLayer_.currentFrame();
    // Sparse sessions only hold snapshots of confirmed frames.
    const core::Frame loadFrom = sparse ? syncLayer_.lastSavedFrame() : seekTo;
    if (loadFrom.isNull() || loadFrom >= current)
    {
        syncLayer_.resetPrediction();
        return {};
    }
    const core::i32 count = current - loadFrom;
    const core::Frame saveAt = minConfirmedFrame();

    core::Log::debug(kTag, std::format("rolling back {} frames to frame {} (first mismatch at {})", count,
                                       loadFrom.value(), seekTo.value()));

    const netcode::SavedState *state = RWN_TRY(syncLayer_.loadFrame(loadFrom));
    callbacks_.loadState(state->frame, state->buffer);
    syncLayer_.resetPrediction();

    replaying_ = true;
    for (core::i32 i = 0; i < count; ++i)
    {
        if (sparse && i > 0 && syncLayer_.currentFrame() == saveAt)
        {
            if (auto saved = saveCurrentState(std::nullopt); !saved)
            {
                replaying_ = false;
                return saved;
            }
        }
        auto inputs = syncLayer_.synchronizedInputs(localConnectStatus_);
        if (!inputs)
        {
            replaying_ = false;
            return std::unexpected(std::move(inputs.error()));
        }
        callbacks_.advanceFrame(*inputs, true);
        syncLayer_.advanceFrame();
        if (sparse)
            continue;
        if (auto saved = saveCurrentState(std::nullopt); !saved)
        {
            replaying_ = false;
            return saved;
        }
    }
    replaying_ = false;
    return {};
}

core::Expected<void> P2PSession::checkLastSavedState()
{
    const core::Frame current = syncLayer_.currentFrame();
    const core::Frame lastSaved = syncLayer_.lastSavedFrame();
    if (lastSaved.isNull() || current - lastSaved < static_cast<core::i32>(config_.maxPrediction()))
        return {};

    const core::Frame confirmed = minConfirmedFrame();
    if (confirmed >= current)
        return saveCurrentState(std::nullopt);
    if (confirmed <= lastSaved)
        return {};

    // The snapshot is about to leave the prediction window: replay from it so
    // the newest confirmed frame gets saved on the way.
    RWN_TRY_VOID(adjustSimulation(lastSaved));
    disconnectFrame_ = core::Frame::null();
    return {};
}

core::Expected<std::vector<netcode::PlayerFrameInput>> P2PSession::confirmedInputsForFrame(core::Frame frame) const
{
    RWN_TRY_VOID(checkFatal());
    if (!frame.isValid() || frame > minConfirmedFrame())
    {
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("frame {} is not confirmed yet (confirmed: {})", frame.value(),
                                           minConfirmedFrame().value()));
    }
    return syncLayer_.confirmedInputs(frame, localConnectStatus_);
}

// -------------------------------------------------------------------------- //
//  Network                                                                   //
// -------------------------------------------------------------------------- //

core::Expected<void> P2PSession::doPoll()
{
    pollRemote();

    if (state_ == SessionState::Running)
    {
        updatePlayerDisconnects();
        if (auto rolled = latch(rollbackIfNeeded(false)); !rolled)
        {
            flushEndpoints();
            return rolled;
        }

        const bool sparse = config_.saveMode() == SaveMode::Sparse;
        if (sparse)
        {
            if (auto saved = latch(checkLastSavedState()); !saved)
            {
                flushEndpoints();
                return saved;
            }
        }
        syncLayer_.setLastConfirmedFrame(minConfirmedFrame(), sparse);

        if (config_.desyncDetection().enabled)
        {
            sendChecksums();
            if (auto compared = compareChecksums(); !compared)
            {
                flushEndpoints();
                return compared;
            }
        }
        checkWaitRecommendation();
    }

    flushEndpoints();
    return {};
}

protocol::PeerProtocol *P2PSession::endpointFor(const transport::PeerAddress &address) noexcept
{
    for (auto &endpoint : endpoints_)
        if (endpoint->isHandlingMessage(address))
            return endpoint.get();
    return nullptr;
}

void P2PSession::pollRemote()
{
    std::array<core::byte, core::kMaxDatagramSize> buffer{};
    transport::PeerAddress from;

    for (core::usize i = 0; i < kMaxDatagramsPerPoll; ++i)
    {
        const auto received = transport_.receiveFrom(buffer, from);
        if (!received)
        {
            core::Log::warn(kTag, std::format("receive failed: {}", received.error().describe()));
            break;
        }
        if (*received == 0)
            break;

        auto message = protocol::decodeMessage(std::span{buffer}.first(*received));
        if (!message)
        {
            core::Log::warn(kTag, std::format("dropping datagram from {}: {}", from.toString(),
                                              message.error().describe()));
            continue;
        }
        auto *endpoint = endpointFor(from);
        if (endpoint == nullptr)
        {
            core::Log::debug(kTag, std::format("dropping datagram from unknown peer {}", from.toString()));
            continue;
        }
        endpoint->handleMessage(*message);
    }

    for (core::usize i = 0; i < endpoints_.size(); ++i)
    {
        for (auto &peerEvent : endpoints_[i]->poll(localConnectStatus_))
            handlePeerEvent(i, peerEvent);
    }
}

void P2PSession::flushEndpoints()
{
    for (auto &endpoint : endpoints_)
    {
        if (auto flushed = endpoint->flush(transport_); !flushed)
            core::Log::warn(kTag, std::format("send to {} failed: {}", endpoint->address().toString(),
                                              flushed.error().describe()));
    }
}

void P2PSession::handlePeerEvent(core::usize endpoint, protocol::PeerEvent &peerEvent)
{
    const auto address = endpoints_[endpoint]->address();
    std::visit(
        [&](auto &ev) {
            using T = std::decay_t<decltype(ev)>;
            if constexpr (std::is_same_v<T, protocol::event::Synchronizing>)
            {
                pushEvent(event::Synchronizing{address, ev.total, ev.count});
            }
            else if constexpr (std::is_same_v<T, protocol::event::Synchronized>)
            {
                pushEvent(event::Synchronized{address});
                checkInitialSync();
            }
            else if constexpr (std::is_same_v<T, protocol::event::Input>)
            {
                handleRemoteInput(endpoint, ev);
            }
            else if constexpr (std::is_same_v<T, protocol::event::Disconnected>)
            {
                pushEvent(event::Disconnected{address});
                for (const auto handle : endpoints_[endpoint]->handles())
                    disconnectPlayerAtFrame(handle, localConnectStatus_[handle.index()].lastFrame);
            }
            else if constexpr (std::is_same_v<T, protocol::event::NetworkInterrupted>)
            {
                pushEvent(event::NetworkInterrupted{address, ev.disconnectTimeoutMs});
            }
            else if constexpr (std::is_same_v<T, protocol::event::NetworkResumed>)
            {
                pushEvent(event::NetworkResumed{address});
            }
            else if constexpr (std::is_same_v<T, protocol::event::SyncTimeout>)
            {
                pushEvent(event::SyncTimeout{address, ev.elapsedMs});
            }
        },
        peerEvent);
}

void P2PSession::handleRemoteInput(core::usize endpoint, const protocol::event::Input &input)
{
    const auto &handles = endpoints_[endpoint]->handles();
    const core::usize inputSize = config_.inputSize();
    if (input.bytes.size() != handles.size() * inputSize)
    {
        core::Log::warn(kTag, std::format("input of {} bytes from {} for {} players", input.bytes.size(),
                                          endpoints_[endpoint]->address().toString(), handles.size()));
        return;
    }

    for (core::usize k = 0; k < handles.size(); ++k)
    {
        const auto handle = handles[k];
        auto &status = localConnectStatus_[handle.index()];
        if (status.disconnected)
            continue;
        if (!status.lastFrame.isNull() && input.frame != status.lastFrame + 1)
            continue;

        const auto slice = std::span{input.bytes}.subspan(k * inputSize, inputSize);
        auto gameInput = netcode::GameInput::fromBytes(input.frame, slice);
        if (!gameInput)
        {
            core::Log::warn(kTag, gameInput.error().describe());
            continue;
        }
        if (auto added = syncLayer_.addRemoteInput(handle, *gameInput); !added)
        {
            core::Log::warn(kTag, std::format("player {}: {}", handle.index(), added.error().describe()));
            continue;
        }
        status.lastFrame = input.frame;
    }
}

void P2PSession::checkInitialSync()
{
    if (state_ != SessionState::Synchronizing)
        return;
    const bool allSynchronized = std::ranges::all_of(endpoints_, [](const auto &endpoint) {
        return endpoint->isSynchronized();
    });
    if (!allSynchronized)
        return;

    state_ = SessionState::Running;
    core::Log::info(kTag, "all peers synchronized, session running");
    pushEvent(event::Running{});
}

void P2PSession::updatePlayerDisconnects()
{
    for (core::u32 i = 0; i < config_.numPlayers(); ++i)
    {
        bool queueConnected = true;
        core::Frame queueMinConfirmed{core::Frame::kMaxValue};

        for (const auto &endpoint : endpoints_)
        {
            if (!endpoint->isRunning())
                continue;
            const auto status = endpoint->peerConnectStatus(core::PlayerHandle{i});
            queueConnected = queueConnected && !status.disconnected;
            queueMinConfirmed = std::min(queueMinConfirmed, status.lastFrame);
        }

        const auto &local = localConnectStatus_[i];
        if (!local.disconnected)
            queueMinConfirmed = std::min(queueMinConfirmed, local.lastFrame);

        if (!queueConnected && (!local.disconnected || local.lastFrame > queueMinConfirmed))
        {
            core::Log::info(kTag, std::format("peers report player {} disconnected at frame {}", i,
                                              queueMinConfirmed.value()));
            disconnectPlayerAtFrame(core::PlayerHandle{i}, queueMinConfirmed);
        }
    }
}

void P2PSession::disconnectPlayerAtFrame(core::PlayerHandle handle, core::Frame lastFrame)
{
    if (const auto endpoint = endpointOfPlayer_[handle.index()])
    {
        // Every player behind the endpoint goes with it.
        endpoints_[*endpoint]->disconnect();
        for (const auto sibling : endpoints_[*endpoint]->handles())
            freezePlayerInput(sibling, std::min(lastFrame, localConnectStatus_[sibling.index()].lastFrame));
    }
    else
    {
        freezePlayerInput(handle, lastFrame);
    }

    // A peer dropped during the handshake no longer holds the others back.
    checkInitialSync();
}

void P2PSession::freezePlayerInput(core::PlayerHandle handle, core::Frame lastFrame)
{
    auto &status = localConnectStatus_[handle.index()];
    const bool wasConnected = !status.disconnected;

    status.disconnected = true;
    status.lastFrame = std::min(status.lastFrame, lastFrame);

    if (syncLayer_.currentFrame() > status.lastFrame)
    {
        // Frames past the freeze point were simulated with other inputs.
        const core::Frame replayFrom = status.lastFrame + 1;
        if (disconnectFrame_.isNull() || replayFrom < disconnectFrame_)
            disconnectFrame_ = replayFrom;
    }

    if (wasConnected)
        core::Log::info(kTag, std::format("player {} disconnected, input frozen after frame {}", handle.index(),
                                          status.lastFrame.value()));
}

core::Frame P2PSession::minConfirmedFrame() const
{
    core::Frame confirmed{core::Frame::kMaxValue};
    for (const auto &status : localConnectStatus_)
        if (!status.disconnected)
            confirmed = std::min(confirmed, status.lastFrame);
    return confirmed;
}

// -------------------------------------------------------------------------- //
//  Desync detection and timing                                               //
// -------------------------------------------------------------------------- //

void P2PSession::sendChecksums()
{
    const auto interval = static_cast<core::i32>(config_.desyncDetection().interval);
    for (;;)
    {
        const core::Frame next = lastSentChecksumFrame_.isNull() ? core::Frame{interval}
                                                                 : lastSentChecksumFrame_ + interval;
        if (next > syncLayer_.lastConfirmedFrame() || next > syncLayer_.lastSavedFrame())
            return;

        lastSentChecksumFrame_ = next;
        const auto *saved = syncLayer_.savedState(next);
        if (saved == nullptr)
        {
            core::Log::debug(kTag, std::format("state of frame {} already evicted, checksum not sent", next.value()));
            continue;
        }

        for (auto &endpoint : endpoints_)
            endpoint->sendChecksumReport(next, saved->checksum);

        localChecksumHistory_.insert_or_assign(next, saved->checksum);
        while (localChecksumHistory_.size() > config_.protocolConfig().maxChecksumHistory)
            localChecksumHistory_.erase(localChecksumHistory_.begin());
    }
}

core::Expected<void> P2PSession::compareChecksums()
{
    for (auto &endpoint : endpoints_)
    {
        auto &pending = endpoint->pendingChecksums();
        for (auto it = pending.begin(); it != pending.end();)
        {
            const auto [frame, remoteChecksum] = *it;
            const auto local = localChecksumHistory_.find(frame);
            if (local == localChecksumHistory_.end())
            {
                // Not computed locally yet; or skipped and never will be.
                const bool stale = !localChecksumHistory_.empty() && frame < localChecksumHistory_.rbegin()->first;
                it = stale ? pending.erase(it) : std::next(it);
                continue;
            }

            if (local->second != remoteChecksum)
            {
                pushEvent(event::DesyncDetected{frame, local->second, remoteChecksum, endpoint->address()});
                return latch(core::makeError(
                    core::ErrorCode::kDesyncDetected,
                    std::format("frame {} hashes to {:#018x} locally and {:#018x} on {}", frame.value(), local->second,
                                remoteChecksum, endpoint->address().toString())));
            }
            it = pending.erase(it);
        }
    }
    return {};
}

core::i32 P2PSession::framesAhead() const noexcept
{
    core::i32 ahead = 0;
    for (const auto &endpoint : endpoints_)
        if (endpoint->isRunning())
            ahead = std::max(ahead, endpoint->averageFrameAdvantage());
    return ahead;
}

void P2PSession::checkWaitRecommendation()
{
    const core::Frame current = syncLayer_.currentFrame();
    if (current <= nextRecommendedSleep_)
        return;
    const core::i32 skip = framesAhead();
    if (skip < core::kMinRecommendation)
        return;
    nextRecommendedSleep_ = current + static_cast<core::i32>(core::kRecommendationInterval);
    pushEvent(event::WaitRecommendation{static_cast<core::u32>(skip)});
}

// -------------------------------------------------------------------------- //
//  Host queries and controls                                                 //
// -------------------------------------------------------------------------- //

core::Expected<void> P2PSession::disconnectPlayer(core::PlayerHandle handle)
{
    RWN_TRY(core::PlayerHandle::create(handle.index(), config_.numPlayers()));
    if (config_.isLocal(handle))
        return core::makeError(core::ErrorCode::kInvalidRequest, "local players cannot be disconnected");
    if (localConnectStatus_[handle.index()].disconnected)
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("player {} is already disconnected", handle.index()));

    disconnectPlayerAtFrame(handle, localConnectStatus_[handle.index()].lastFrame);
    flushEndpoints();
    return {};
}

core::Expected<void> P2PSession::setFrameDelay(core::PlayerHandle handle, core::u32 delay)
{
    RWN_TRY(core::PlayerHandle::create(handle.index(), config_.numPlayers()));
    if (!config_.isLocal(handle))
        return core::makeError(core::ErrorCode::kInvalidRequest, "frame delay only applies to local players");
    if (!syncLayer_.lastSavedFrame().isNull())
        return core::makeError(core::ErrorCode::kInvalidRequest, "frame delay cannot change once the match started");
    if (delay > config_.maxPrediction())
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("frame delay {} exceeds maxPrediction {}", delay, config_.maxPrediction()));

    for (const auto local : localHandles_)
        RWN_TRY_VOID(syncLayer_.setFrameDelay(local, delay));
    return {};
}

core::Expected<protocol::NetworkStats> P2PSession::networkStats(core::PlayerHandle handle) const
{
    RWN_TRY(core::PlayerHandle::create(handle.index(), config_.numPlayers()));
    const auto endpoint = endpointOfPlayer_[handle.index()];
    if (!endpoint)
        return core::makeError(core::ErrorCode::kInvalidRequest,
                               std::format("player {} is local; no link statistics", handle.index()));
    return endpoints_[*endpoint]->networkStats();
}

void P2PSession::pushEvent(SessionEvent event)
{
    if (callbacks_.onEvent)
    {
        callbacks_.onEvent(event);
        return;
    }
    events_.push_back(std::move(event));
    while (events_.size() > core::kMaxEventQueueSize)
        events_.pop_front();
}

std::vector<SessionEvent> P2PSession::drainEvents()
{
    std::vector<SessionEvent> drained(std::make_move_iterator(events_.begin()), std::make_move_iterator(events_.end()));
    events_.clear();
    return drained;
}

} // namespace rwn::net::session
