/**
 * @file SessionConfig.cpp
 * @brief SessionConfig::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */

#include <rwn/net/session/SessionConfig.hpp>

#include <algorithm>
#include <format>

namespace rwn::net::session {

namespace {

core::Unexpected invalid(std::string message)
{
    return core::makeError(core::ErrorCode::kInvalidConfig, std::move(message));
}

} // namespace

SessionConfig::Builder& SessionConfig::Builder::numPlayers(core::u32 n) noexcept
{
    numPlayers_ = n;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::maxPlayers(core::u32 n) noexcept
{
    maxPlayers_ = n;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::inputSize(core::u32 bytes) noexcept
{
    inputSize_ = bytes;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::inputDelay(core::u32 frames) noexcept
{
    inputDelay_ = frames;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::maxPrediction(core::u32 frames) noexcept
{
    maxPrediction_ = frames;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::queueLength(core::u32 frames) noexcept
{
    queueLength_ = frames;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::fps(core::u32 hz) noexcept
{
    fps_ = hz;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::checkDistance(core::u32 frames) noexcept
{
    checkDistance_ = frames;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::desyncDetection(protocol::DesyncDetection detection) noexcept
{
    desync_ = detection;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::syncConfig(const protocol::SyncConfig &sync) noexcept
{
    sync_ = sync;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::protocolConfig(const protocol::ProtocolConfig &protocol) noexcept
{
    protocol_ = protocol;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::disconnectTimeout(core::u64 ms) noexcept
{
    disconnectTimeoutMs_ = ms;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::disconnectNotifyStart(core::u64 ms) noexcept
{
    disconnectNotifyStartMs_ = ms;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::predictionStrategy(
    std::shared_ptr<const netcode::IPredictionStrategy> strategy) noexcept
{
    predictor_ = std::move(strategy);
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::rngSeed(core::u64 seed) noexcept
{
    rngSeed_ = seed;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::saveMode(SaveMode mode) noexcept
{
    saveMode_ = mode;
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::addLocalPlayer(core::PlayerHandle handle)
{
    players_.push_back(PlayerSlot{handle, PlayerKind::Local, std::nullopt});
    return *this;
}

SessionConfig::Builder& SessionConfig::Builder::addRemotePlayer(core::PlayerHandle handle,
                                                                transport::PeerAddress address)
{
    players_.push_back(PlayerSlot{handle, PlayerKind::Remote, address});
    return *this;
}

core::Expected<SessionConfig> SessionConfig::Builder::build() const
{
    if (maxPlayers_ == 0 || maxPlayers_ > core::kMaxPlayers)
        return invalid(std::format("maxPlayers must be in 1..{} (got {})", core::kMaxPlayers, maxPlayers_));
    if (numPlayers_ == 0 || numPlayers_ > maxPlayers_)
        return invalid(std::format("numPlayers must be in 1..{} (got {})", maxPlayers_, numPlayers_));
    if (inputSize_ == 0 || inputSize_ > core::kMaxInputBytes)
        return invalid(std::format("inputSize must be in 1..{} bytes (got {})", core::kMaxInputBytes, inputSize_));
    if (maxPrediction_ == 0)
        return invalid("maxPrediction must be at least 1; lockstep is not supported");
    if (maxPrediction_ >= queueLength_)
        return invalid(std::format("maxPrediction {} must be below queueLength {}", maxPrediction_, queueLength_));
    if (inputDelay_ > maxPrediction_)
        return invalid(std::format("inputDelay {} exceeds maxPrediction {}", inputDelay_, maxPrediction_));
    if (fps_ == 0)
        return invalid("fps must be positive");
    if (desync_.enabled && desync_.interval == 0)
        return invalid("desync detection interval must be positive");
    if (sync_.numSyncPackets == 0)
        return invalid("numSyncPackets must be positive");
    if (protocol_.maxChecksumHistory == 0 || protocol_.pendingOutputLimit == 0)
        return invalid("protocol limits must be positive");
    if (disconnectNotifyStartMs_ > disconnectTimeoutMs_)
        return invalid(std::format("disconnect notification at {} ms comes after the {} ms timeout",
                                   disconnectNotifyStartMs_, disconnectTimeoutMs_));

    SessionConfig cfg;
    cfg.numPlayers_              = numPlayers_;
    cfg.inputSize_               = inputSize_;
    cfg.inputDelay_              = inputDelay_;
    cfg.maxPrediction_           = maxPrediction_;
    cfg.queueLength_             = queueLength_;
    cfg.fps_                     = fps_;
    cfg.checkDistance_           = checkDistance_;
    cfg.rngSeed_                 = rngSeed_;
    cfg.saveMode_                = saveMode_;
    cfg.disconnectTimeoutMs_     = disconnectTimeoutMs_;
    cfg.disconnectNotifyStartMs_ = disconnectNotifyStartMs_;
    cfg.desync_                  = desync_;
    cfg.sync_                    = sync_;
    cfg.protocol_                = protocol_;
    cfg.predictor_               = predictor_ ? predictor_ : netcode::defaultPredictionStrategy();
    cfg.players_                 = players_;

    std::ranges::sort(cfg.players_, {}, &PlayerSlot::handle);
    for (core::usize i = 0; i < cfg.players_.size(); ++i)
    {
        const auto handle = cfg.players_[i].handle;
        RWN_TRY(core::PlayerHandle::create(handle.index(), numPlayers_));
        if (i > 0 && cfg.players_[i - 1].handle == handle)
            return invalid(std::format("player {} registered twice", handle.index()));
    }
    return cfg;
}

std::vector<core::PlayerHandle> SessionConfig::localHandles() const
{
    std::vector<core::PlayerHandle> handles;
    for (const auto &slot : players_)
        if (slot.kind == PlayerKind::Local)
            handles.push_back(slot.handle);
    return handles;
}

std::map<transport::PeerAddress, std::vector<core::PlayerHandle>> SessionConfig::remoteEndpoints() const
{
    std::map<transport::PeerAddress, std::vector<core::PlayerHandle>> endpoints;
    for (const auto &slot : players_)
        if (slot.kind == PlayerKind::Remote && slot.address)
            endpoints[*slot.address].push_back(slot.handle);
    return endpoints;
}

bool SessionConfig::isLocal(core::PlayerHandle handle) const noexcept
{
    return std::ranges::any_of(players_, [handle](const PlayerSlot &slot) {
        return slot.handle == handle && slot.kind == PlayerKind::Local;
    });
}

} // namespace rwn::net::session
