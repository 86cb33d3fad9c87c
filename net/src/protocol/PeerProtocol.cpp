/**
 * @file PeerProtocol.cpp
 * @brief PeerProtocol implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/protocol/PeerProtocol.hpp>
#include <rwn/net/protocol/InputCompression.hpp>
#include <rwn/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>
#include <optional>
#include <utility>

namespace rwn::net::protocol {

namespace {

constexpr std::string_view kTag = "PeerProtocol";
constexpr core::u64 kUdpHeaderSize = 28;
constexpr core::f64 kRttSmoothing = 0.125;

} // namespace

// -------------------------------------------------------------------------- //
//  Construction                                                              //
// -------------------------------------------------------------------------- //

PeerProtocol::PeerProtocol(PeerProtocolParams params, const core::IClock &clock)
    : params_(std::move(params)), clock_(clock), rng_(static_cast<std::mt19937::result_type>(params_.seed))
{
    std::ranges::sort(params_.handles);

    std::uniform_int_distribution<core::u32> dist{1, std::numeric_limits<core::u16>::max()};
    magic_ = static_cast<core::u16>(dist(rng_));

    peerConnectStatus_.resize(params_.numPlayers);
    lastLocalStatus_.resize(params_.numPlayers);

    const auto endpointInputSize = static_cast<core::usize>(params_.handles.size()) * params_.inputSize;
    recvInputs_.emplace(core::Frame::null(), std::vector<core::byte>(endpointInputSize));
    lastAckedInput_.bytes.resize(static_cast<core::usize>(params_.localPlayers) * params_.inputSize);

    const auto now = clock_.nowMs();
    lastRecvMs_ = now;
    lastSendMs_ = now;
    lastInputRecvMs_ = now;
    lastQualityReportMs_ = now;
}

// -------------------------------------------------------------------------- //
//  Lifecycle                                                                 //
// -------------------------------------------------------------------------- //

void PeerProtocol::synchronize()
{
    if (state_ != PeerState::Initializing)
        return;
    const auto now = clock_.nowMs();
    state_ = PeerState::Synchronizing;
    syncRemainingRoundtrips_ = params_.sync.numSyncPackets;
    statsStartMs_ = now;
    lastRecvMs_ = now;
    sendSyncRequest();
}

void PeerProtocol::disconnect()
{
    if (state_ == PeerState::Shutdown || state_ == PeerState::Disconnected)
        return;
    const bool wasRunning = state_ == PeerState::Running;
    state_ = PeerState::Disconnected;
    shutdownAtMs_ = clock_.nowMs() + params_.protocol.shutdownDelayMs;
    // Tell the remote side right away instead of letting it time out.
    if (wasRunning)
        sendPendingOutput(lastLocalStatus_);
    core::Log::info(kTag, std::format("disconnecting from {}", params_.address.toString()));
}

std::vector<PeerEvent> PeerProtocol::poll(std::span<const netcode::ConnectionStatus> localStatus)
{
    const auto now = clock_.nowMs();
    if (localStatus.size() == lastLocalStatus_.size())
        std::ranges::copy(localStatus, lastLocalStatus_.begin());

    switch (state_)
    {
    case PeerState::Synchronizing:
        if (params_.sync.syncTimeoutMs > 0 && !syncTimeoutSent_ && statsStartMs_ + params_.sync.syncTimeoutMs < now)
        {
            events_.emplace_back(event::SyncTimeout{now - statsStartMs_});
            syncTimeoutSent_ = true;
        }
        if (lastSendMs_ + params_.sync.syncRetryIntervalMs < now)
        {
            core::Log::debug(kTag, std::format("retrying sync with {} ({} round trips left)",
                                               params_.address.toString(), syncRemainingRoundtrips_));
            sendSyncRequest();
        }
        break;

    case PeerState::Running:
        if (lastInputRecvMs_ + params_.sync.runningRetryIntervalMs < now)
        {
            sendPendingOutput(lastLocalStatus_);
            lastInputRecvMs_ = now;
        }
        if (lastQualityReportMs_ + params_.protocol.qualityReportIntervalMs < now)
            sendQualityReport();
        if (lastSendMs_ + params_.sync.keepAliveIntervalMs < now)
            queueMessage(KeepAlive{});
        if (!disconnectNotifySent_ && lastRecvMs_ + params_.disconnectNotifyStartMs < now)
        {
            core::Log::warn(kTag, std::format("no traffic from {} for {} ms", params_.address.toString(),
                                              now - lastRecvMs_));
            events_.emplace_back(
                event::NetworkInterrupted{params_.disconnectTimeoutMs - params_.disconnectNotifyStartMs});
            disconnectNotifySent_ = true;
        }
        if (!disconnectEventSent_ && lastRecvMs_ + params_.disconnectTimeoutMs < now)
        {
            core::Log::warn(kTag, std::format("{} timed out", params_.address.toString()));
            events_.emplace_back(event::Disconnected{});
            disconnectEventSent_ = true;
        }
        break;

    case PeerState::Disconnected:
        if (shutdownAtMs_ < now)
        {
            state_ = PeerState::Shutdown;
            sendQueue_.clear();
        }
        break;

    case PeerState::Initializing:
    case PeerState::Shutdown:
        break;
    }

    return std::exchange(events_, {});
}

// -------------------------------------------------------------------------- //
//  Sending                                                                   //
// -------------------------------------------------------------------------- //

void PeerProtocol::queueMessage(MessageBody body)
{
    sendQueue_.push_back(Message{MessageHeader{magic_, core::kProtocolVersion}, std::move(body)});
    lastSendMs_ = clock_.nowMs();
}

void PeerProtocol::sendSyncRequest()
{
    const auto random = rng_();
    syncRandomRequests_.push_back(random);
    // Replies to long-lost requests are no longer worth accepting.
    while (syncRandomRequests_.size() > static_cast<core::usize>(params_.sync.numSyncPackets) * 2)
        syncRandomRequests_.pop_front();
    queueMessage(SyncRequest{random});
}

void PeerProtocol::sendQualityReport()
{
    const auto now = clock_.nowMs();
    lastQualityReportMs_ = now;
    const auto advantage = std::clamp<core::i32>(localFrameAdvantage_, std::numeric_limits<core::i16>::min(),
                                                 std::numeric_limits<core::i16>::max());
    queueMessage(QualityReport{static_cast<core::i16>(advantage), now});
}

void PeerProtocol::sendInput(core::Frame frame,
                             std::span<const core::byte> bytes,
                             std::span<const netcode::ConnectionStatus> localStatus)
{
    if (state_ != PeerState::Running)
        return;
    if (localStatus.size() == lastLocalStatus_.size())
        std::ranges::copy(localStatus, lastLocalStatus_.begin());

    timeSync_.advanceFrame(frame, localFrameAdvantage_, remoteFrameAdvantage_);
    pendingOutput_.push_back(PendingInput{frame, {bytes.begin(), bytes.end()}});

    if (pendingOutput_.size() > params_.protocol.pendingOutputLimit && !disconnectEventSent_)
    {
        core::Log::warn(kTag, std::format("{} unacknowledged frames for {}, dropping peer",
                                          pendingOutput_.size(), params_.address.toString()));
        events_.emplace_back(event::Disconnected{});
        disconnectEventSent_ = true;
    }

    sendPendingOutput(lastLocalStatus_);
}

void PeerProtocol::sendPendingOutput(std::span<const netcode::ConnectionStatus> localStatus)
{
    InputMessage body;
    body.ackFrame = lastReceivedFrame();
    body.disconnectRequested = state_ == PeerState::Disconnected;
    body.peerConnectStatus.assign(localStatus.begin(), localStatus.end());

    if (!pendingOutput_.empty())
    {
        const auto empty = encodeMessage(Message{MessageHeader{magic_, core::kProtocolVersion}, body});
        if (!empty)
        {
            core::Log::error(kTag, empty.error().describe());
            return;
        }
        // Two more bytes for the payload length once it outgrows one varint byte.
        const core::usize budget = core::kMaxDatagramSize - empty->size() - 2;

        // Oldest frames first; the rest follow once these are acknowledged.
        core::usize count = pendingOutput_.size();
        for (;;)
        {
            std::vector<std::vector<core::byte>> inputs;
            inputs.reserve(count);
            for (core::usize i = 0; i < count; ++i)
                inputs.push_back(pendingOutput_[i].bytes);

            auto encoded = InputCompression::encode(lastAckedInput_.bytes, inputs);
            if (!encoded)
            {
                core::Log::error(kTag, encoded.error().describe());
                return;
            }
            if (encoded->size() <= budget || count == 1)
            {
                body.startFrame = pendingOutput_.front().frame;
                body.bytes = std::move(*encoded);
                break;
            }
            count = std::max<core::usize>(1, std::min(count - 1, count * budget / encoded->size()));
        }
        if (count < pendingOutput_.size())
            core::Log::debug(kTag, std::format("sending {} of {} pending frames to {}", count, pendingOutput_.size(),
                                               params_.address.toString()));
    }
    queueMessage(std::move(body));
}

void PeerProtocol::sendChecksumReport(core::Frame frame, core::u64 checksum)
{
    if (state_ != PeerState::Running)
        return;
    queueMessage(ChecksumReport{frame, checksum});
}

core::Expected<void> PeerProtocol::flush(transport::ITransport &transport)
{
    std::optional<core::Error> firstError;
    while (!sendQueue_.empty())
    {
        const auto message = std::move(sendQueue_.front());
        sendQueue_.pop_front();

        auto datagram = encodeMessage(message);
        if (!datagram)
        {
            core::Log::error(kTag, datagram.error().describe());
            continue;
        }
        auto sent = transport.sendTo(*datagram, params_.address);
        if (!sent)
        {
            if (!firstError)
                firstError = std::move(sent.error());
            continue;
        }
        bytesSent_ += datagram->size();
        ++packetsSent_;
    }
    if (firstError)
        return std::unexpected(std::move(*firstError));
    return {};
}

// -------------------------------------------------------------------------- //
//  Receiving                                                                 //
// -------------------------------------------------------------------------- //

void PeerProtocol::handleMessage(const Message &message)
{
    if (state_ == PeerState::Shutdown)
        return;
    if (remoteMagic_ != 0 && message.header.magic != remoteMagic_)
    {
        core::Log::debug(kTag, std::format("dropping message with foreign magic {:#06x}", message.header.magic));
        return;
    }

    lastRecvMs_ = clock_.nowMs();
    if (disconnectNotifySent_ && state_ == PeerState::Running)
    {
        core::Log::info(kTag, std::format("traffic from {} resumed", params_.address.toString()));
        events_.emplace_back(event::NetworkResumed{});
        disconnectNotifySent_ = false;
    }

    std::visit(
        [&](const auto &body) {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, SyncRequest>)
                onSyncRequest(message.header, body);
            else if constexpr (std::is_same_v<T, SyncReply>)
                onSyncReply(message.header, body);
            else if constexpr (std::is_same_v<T, InputMessage>)
                onInput(body);
            else if constexpr (std::is_same_v<T, InputAck>)
                popPendingOutput(body.ackFrame);
            else if constexpr (std::is_same_v<T, QualityReport>)
                onQualityReport(body);
            else if constexpr (std::is_same_v<T, QualityReply>)
                onQualityReply(body);
            else if constexpr (std::is_same_v<T, ChecksumReport>)
                onChecksumReport(body);
        },
        message.body);
}

void PeerProtocol::onSyncRequest(const MessageHeader &, const SyncRequest &body)
{
    queueMessage(SyncReply{body.randomRequest});
}

void PeerProtocol::onSyncReply(const MessageHeader &header, const SyncReply &body)
{
    if (state_ != PeerState::Synchronizing)
        return;
    const auto pending = std::ranges::find(syncRandomRequests_, body.randomReply);
    if (pending == syncRandomRequests_.end())
        return;
    syncRandomRequests_.erase(pending);

    if (syncRemainingRoundtrips_ > 0)
        --syncRemainingRoundtrips_;

    if (syncRemainingRoundtrips_ > 0)
    {
        events_.emplace_back(event::Synchronizing{params_.sync.numSyncPackets,
                                                  params_.sync.numSyncPackets - syncRemainingRoundtrips_});
        sendSyncRequest();
        return;
    }

    const auto now = clock_.nowMs();
    state_ = PeerState::Running;
    remoteMagic_ = header.magic;
    lastInputRecvMs_ = now;
    lastQualityReportMs_ = now;
    syncRandomRequests_.clear();
    events_.emplace_back(event::Synchronized{});
    core::Log::info(kTag, std::format("synchronized with {}", params_.address.toString()));
}

const std::vector<core::byte> *PeerProtocol::decodeReference(core::Frame startFrame) const
{
    if (lastReceivedFrame().isNull())
        return &recvInputs_.at(core::Frame::null());

    const auto reference = startFrame - 1;
    if (const auto it = recvInputs_.find(reference); it != recvInputs_.end())
        return &it->second;

    // The sender has never seen an acknowledgement, so it still encodes
    // against the blank input.
    const auto firstReceived = recvInputs_.upper_bound(core::Frame::null());
    if (firstReceived != recvInputs_.end() && reference < firstReceived->first)
        return &recvInputs_.at(core::Frame::null());
    return nullptr;
}

void PeerProtocol::onInput(const InputMessage &body)
{
    popPendingOutput(body.ackFrame);

    if (body.disconnectRequested)
    {
        if (state_ != PeerState::Disconnected && !disconnectEventSent_)
        {
            core::Log::info(kTag, std::format("{} requested disconnect", params_.address.toString()));
            events_.emplace_back(event::Disconnected{});
            disconnectEventSent_ = true;
        }
    }
    else
    {
        const auto count = std::min(body.peerConnectStatus.size(), peerConnectStatus_.size());
        for (core::usize i = 0; i < count; ++i)
        {
            auto &known = peerConnectStatus_[i];
            const auto &reported = body.peerConnectStatus[i];
            known.disconnected = known.disconnected || reported.disconnected;
            known.lastFrame = std::max(known.lastFrame, reported.lastFrame);
        }
    }

    if (body.bytes.empty())
        return;

    const auto lastReceived = lastReceivedFrame();
    if (!lastReceived.isNull() && body.startFrame > lastReceived + 1)
    {
        core::Log::debug(kTag, std::format("gap in input from {}: expected {}, got {}", params_.address.toString(),
                                           (lastReceived + 1).value(), body.startFrame.value()));
        return;
    }

    const auto *reference = decodeReference(body.startFrame);
    if (reference == nullptr)
    {
        core::Log::debug(kTag, std::format("no reference input for frame {} from {}",
                                           (body.startFrame - 1).value(), params_.address.toString()));
        return;
    }

    auto decoded = InputCompression::decode(*reference, body.bytes, params_.protocol.pendingOutputLimit + 1);
    if (!decoded)
    {
        core::Log::warn(kTag, std::format("undecodable input from {}: {}", params_.address.toString(),
                                          decoded.error().describe()));
        return;
    }

    auto frame = body.startFrame;
    for (auto &bytes : *decoded)
    {
        if (frame > lastReceived)
        {
            recvInputs_.insert_or_assign(frame, bytes);
            events_.emplace_back(event::Input{frame, std::move(bytes)});
        }
        ++frame;
    }

    lastInputRecvMs_ = clock_.nowMs();
    queueMessage(InputAck{lastReceivedFrame()});

    // Keep the blank reference and a window the sender may still encode against.
    const auto keepFrom = lastReceivedFrame() - static_cast<core::i32>(2 * params_.maxPrediction);
    if (keepFrom.isValid())
        recvInputs_.erase(recvInputs_.upper_bound(core::Frame::null()), recvInputs_.lower_bound(keepFrom));
}

void PeerProtocol::popPendingOutput(core::Frame ackFrame)
{
    while (!pendingOutput_.empty() && pendingOutput_.front().frame <= ackFrame)
    {
        lastAckedInput_ = std::move(pendingOutput_.front());
        pendingOutput_.pop_front();
    }
}

void PeerProtocol::onQualityReport(const QualityReport &body)
{
    remoteFrameAdvantage_ = body.frameAdvantage;
    queueMessage(QualityReply{body.pingMs});
}

void PeerProtocol::onQualityReply(const QualityReply &body)
{
    const auto now = clock_.nowMs();
    if (body.pongMs > now)
        return;
    const auto sample = static_cast<core::f64>(now - body.pongMs);
    if (roundTripMs_ == 0.0)
        roundTripMs_ = sample;
    else
        roundTripMs_ += kRttSmoothing * (sample - roundTripMs_);
}

void PeerProtocol::onChecksumReport(const ChecksumReport &body)
{
    if (!params_.desync.enabled || !body.frame.isValid())
        return;
    if (pendingChecksums_.size() >= params_.protocol.maxChecksumHistory)
    {
        const auto span = static_cast<core::i32>((params_.protocol.maxChecksumHistory - 1) * params_.desync.interval);
        const auto oldestKept = body.frame - span;
        std::erase_if(pendingChecksums_, [oldestKept](const auto &entry) { return entry.first < oldestKept; });
    }
    pendingChecksums_.insert_or_assign(body.frame, body.checksum);
}

// -------------------------------------------------------------------------- //
//  Queries                                                                   //
// -------------------------------------------------------------------------- //

void PeerProtocol::updateLocalFrameAdvantage(core::Frame localFrame)
{
    const auto lastReceived = lastReceivedFrame();
    if (!localFrame.isValid() || !lastReceived.isValid())
        return;
    // Estimate where the remote simulation is now: half a round trip past
    // the newest frame it sent us.
    const auto inFlightFrames = static_cast<core::i32>(roundTripMs_ * params_.fps / 2000.0);
    const auto remoteFrame = lastReceived + inFlightFrames;
    localFrameAdvantage_ = remoteFrame - localFrame;
}

core::Expected<NetworkStats> PeerProtocol::networkStats() const
{
    if (state_ != PeerState::Synchronizing && state_ != PeerState::Running)
        return core::makeError(core::ErrorCode::kNotSynchronized,
                               std::format("no link statistics for {} in this state", params_.address.toString()));

    const auto now = clock_.nowMs();
    const auto elapsedSec = static_cast<core::f64>(now - statsStartMs_) / 1000.0;

    NetworkStats stats;
    stats.sendQueueLength = static_cast<core::u32>(pendingOutput_.size());
    stats.pingMs = static_cast<core::u64>(std::llround(roundTripMs_));
    if (elapsedSec > 0.0)
    {
        const auto totalBytes = static_cast<core::f64>(bytesSent_ + packetsSent_ * kUdpHeaderSize);
        stats.kbpsSent = static_cast<core::u32>(totalBytes / elapsedSec / 1024.0);
    }
    stats.localFramesBehind = localFrameAdvantage_;
    stats.remoteFramesBehind = remoteFrameAdvantage_;
    stats.recommendedInputDelay = static_cast<core::u32>(std::ceil(roundTripMs_ / 2.0 * params_.fps / 1000.0));
    return stats;
}

netcode::ConnectionStatus PeerProtocol::peerConnectStatus(core::PlayerHandle handle) const
{
    if (!handle.isValidFor(static_cast<core::u32>(peerConnectStatus_.size())))
        return {};
    return peerConnectStatus_[handle.index()];
}

core::Frame PeerProtocol::lastReceivedFrame() const noexcept
{
    return recvInputs_.rbegin()->first;
}

} // namespace rwn::net::protocol
