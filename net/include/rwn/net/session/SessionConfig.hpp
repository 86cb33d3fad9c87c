/**
 * @file SessionConfig.hpp
 * @brief Session configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_NET_SESSION_SESSIONCONFIG_HPP
    #define RWN_NET_SESSION_SESSIONCONFIG_HPP

#include <rwn/net/netcode/IPredictionStrategy.hpp>
#include <rwn/net/protocol/ProtocolConfig.hpp>
#include <rwn/net/transport/PeerAddress.hpp>
#include <rwn/core/Constants.hpp>
#include <rwn/core/Expected.hpp>
#include <rwn/core/Frame.hpp>
#include <rwn/core/Types.hpp>

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace rwn::net::session {

/** @brief Where a player's input comes from. */
enum class PlayerKind : core::u8
{
    Local,
    Remote
};

/** @brief When the session asks the host for snapshots. */
enum class SaveMode : core::u8
{
    /// Every frame; a rollback reloads the first mispredicted frame.
    EveryFrame,
    /// Only fully confirmed frames; a rollback reloads the last of them
    /// and replays further. Suits games with expensive snapshots.
    Sparse
};

/** @brief One registered player slot. */
struct PlayerSlot
{
    core::PlayerHandle                    handle{};
    PlayerKind                            kind{PlayerKind::Local};
    std::optional<transport::PeerAddress> address;
};

/** @brief Immutable, validated session configuration. */
class SessionConfig
{
public:
    /**
     * @brief Fluent builder for SessionConfig.
     *
     * Setters never fail; every constraint is checked by @ref build so that
     * the first violation is reported with its reason.
     */
    class Builder
    {
    public:
        Builder& numPlayers(core::u32 n) noexcept;
        Builder& maxPlayers(core::u32 n) noexcept;
        Builder& inputSize(core::u32 bytes) noexcept;
        Builder& inputDelay(core::u32 frames) noexcept;
        Builder& maxPrediction(core::u32 frames) noexcept;
        Builder& queueLength(core::u32 frames) noexcept;
        Builder& fps(core::u32 hz) noexcept;
        Builder& checkDistance(core::u32 frames) noexcept;
        Builder& desyncDetection(protocol::DesyncDetection detection) noexcept;
        Builder& syncConfig(const protocol::SyncConfig &sync) noexcept;
        Builder& protocolConfig(const protocol::ProtocolConfig &protocol) noexcept;
        Builder& disconnectTimeout(core::u64 ms) noexcept;
        Builder& disconnectNotifyStart(core::u64 ms) noexcept;
        Builder& predictionStrategy(std::shared_ptr<const netcode::IPredictionStrategy> strategy) noexcept;
        Builder& rngSeed(core::u64 seed) noexcept;
        Builder& saveMode(SaveMode mode) noexcept;
        Builder& addLocalPlayer(core::PlayerHandle handle);
        Builder& addRemotePlayer(core::PlayerHandle handle, transport::PeerAddress address);

        /**
         * @brief Validates and freezes the configuration.
         * @return kInvalidConfig for out-of-range settings or duplicate
         *         registrations, kInvalidPlayer for handles outside the session.
         */
        [[nodiscard]] core::Expected<SessionConfig> build() const;

    private:
        core::u32 numPlayers_{2};
        core::u32 maxPlayers_{core::kMaxPlayers};
        core::u32 inputSize_{1};
        core::u32 inputDelay_{core::kDefaultInputDelay};
        core::u32 maxPrediction_{core::kDefaultMaxPrediction};
        core::u32 queueLength_{core::kDefaultQueueLength};
        core::u32 fps_{core::kDefaultFps};
        core::u32 checkDistance_{core::kDefaultCheckDistance};
        core::u64 rngSeed_{0};
        SaveMode  saveMode_{SaveMode::EveryFrame};
        core::u64 disconnectTimeoutMs_{core::kDisconnectTimeoutMs};
        core::u64 disconnectNotifyStartMs_{core::kDisconnectNotifyStartMs};
        protocol::DesyncDetection desync_{};
        protocol::SyncConfig      sync_{};
        protocol::ProtocolConfig  protocol_{};
        std::shared_ptr<const netcode::IPredictionStrategy> predictor_;
        std::vector<PlayerSlot> players_;
    };

    [[nodiscard]] core::u32 numPlayers()    const noexcept { return numPlayers_; }
    [[nodiscard]] core::u32 inputSize()     const noexcept { return inputSize_; }
    [[nodiscard]] core::u32 inputDelay()    const noexcept { return inputDelay_; }
    [[nodiscard]] core::u32 maxPrediction() const noexcept { return maxPrediction_; }
    [[nodiscard]] core::u32 queueLength()   const noexcept { return queueLength_; }
    [[nodiscard]] core::u32 fps()           const noexcept { return fps_; }
    [[nodiscard]] core::u32 checkDistance() const noexcept { return checkDistance_; }
    [[nodiscard]] core::u64 rngSeed()       const noexcept { return rngSeed_; }
    [[nodiscard]] SaveMode  saveMode()      const noexcept { return saveMode_; }
    [[nodiscard]] core::u64 disconnectTimeoutMs()     const noexcept { return disconnectTimeoutMs_; }
    [[nodiscard]] core::u64 disconnectNotifyStartMs() const noexcept { return disconnectNotifyStartMs_; }

    [[nodiscard]] const protocol::DesyncDetection &desyncDetection() const noexcept { return desync_; }
    [[nodiscard]] const protocol::SyncConfig      &syncConfig()      const noexcept { return sync_; }
    [[nodiscard]] const protocol::ProtocolConfig  &protocolConfig()  const noexcept { return protocol_; }
    [[nodiscard]] const std::shared_ptr<const netcode::IPredictionStrategy> &predictionStrategy() const noexcept
    {
        return predictor_;
    }

    /// @brief Registered players, in handle order.
    [[nodiscard]] const std::vector<PlayerSlot> &players() const noexcept { return players_; }

    [[nodiscard]] std::vector<core::PlayerHandle> localHandles() const;

    /// @brief Remote handles grouped by the endpoint that simulates them.
    [[nodiscard]] std::map<transport::PeerAddress, std::vector<core::PlayerHandle>> remoteEndpoints() const;

    [[nodiscard]] bool isLocal(core::PlayerHandle handle) const noexcept;

private:
    friend class Builder;

    core::u32 numPlayers_{2};
    core::u32 inputSize_{1};
    core::u32 inputDelay_{core::kDefaultInputDelay};
    core::u32 maxPrediction_{core::kDefaultMaxPrediction};
    core::u32 queueLength_{core::kDefaultQueueLength};
    core::u32 fps_{core::kDefaultFps};
    core::u32 checkDistance_{core::kDefaultCheckDistance};
    core::u64 rngSeed_{0};
    SaveMode  saveMode_{SaveMode::EveryFrame};
    core::u64 disconnectTimeoutMs_{core::kDisconnectTimeoutMs};
    core::u64 disconnectNotifyStartMs_{core::kDisconnectNotifyStartMs};
    protocol::DesyncDetection desync_{};
    protocol::SyncConfig      sync_{};
    protocol::ProtocolConfig  protocol_{};
    std::shared_ptr<const netcode::IPredictionStrategy> predictor_;
    std::vector<PlayerSlot> players_;
};

} // namespace rwn::net::session

#endif // RWN_NET_SESSION_SESSIONCONFIG_HPP
