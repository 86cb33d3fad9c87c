// /////////////////////////////////////////////////////////////////////////////
/// @file ProtocolConfig.hpp
/// @brief Tunables of the per-peer protocol, with presets.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <rwn/core/Constants.hpp>
#include <rwn/core/Types.hpp>

namespace rwn::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @struct SyncConfig
/// @brief Handshake and retransmission timing.
// /////////////////////////////////////////////////////////////////////////////
struct SyncConfig
{
    core::u32 numSyncPackets{core::kNumSyncPackets};
    core::u64 syncRetryIntervalMs{core::kSyncRetryIntervalMs};
    /// 0 disables the SyncTimeout event.
    core::u64 syncTimeoutMs{core::kSyncTimeoutMs};
    core::u64 runningRetryIntervalMs{core::kRunningRetryIntervalMs};
    core::u64 keepAliveIntervalMs{core::kKeepAliveIntervalMs};

    /// @brief Fewer round trips and faster retries for local networks.
    [[nodiscard]] static constexpr SyncConfig lan() noexcept
    {
        SyncConfig cfg;
        cfg.numSyncPackets         = 3;
        cfg.syncRetryIntervalMs    = 100;
        cfg.runningRetryIntervalMs = 100;
        cfg.keepAliveIntervalMs    = 100;
        return cfg;
    }

    /// @brief More round trips and patient retries for slow links.
    [[nodiscard]] static constexpr SyncConfig highLatency() noexcept
    {
        SyncConfig cfg;
        cfg.numSyncPackets         = 10;
        cfg.syncRetryIntervalMs    = 400;
        cfg.syncTimeoutMs          = 10'000;
        cfg.runningRetryIntervalMs = 400;
        cfg.keepAliveIntervalMs    = 400;
        return cfg;
    }

    bool operator==(const SyncConfig &) const noexcept = default;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct ProtocolConfig
/// @brief Reporting, shutdown and buffering limits.
// /////////////////////////////////////////////////////////////////////////////
struct ProtocolConfig
{
    core::u64 qualityReportIntervalMs{core::kQualityReportIntervalMs};
    core::u64 shutdownDelayMs{core::kShutdownDelayMs};
    core::u32 pendingOutputLimit{core::kPendingOutputLimit};
    core::u32 maxChecksumHistory{core::kMaxChecksumHistory};

    bool operator==(const ProtocolConfig &) const noexcept = default;
};

// /////////////////////////////////////////////////////////////////////////////
/// @struct DesyncDetection
/// @brief Periodic checksum exchange of confirmed frames.
// /////////////////////////////////////////////////////////////////////////////
struct DesyncDetection
{
    bool      enabled{false};
    core::u32 interval{core::kDefaultDesyncInterval};

    [[nodiscard]] static constexpr DesyncDetection on(core::u32 interval) noexcept { return {true, interval}; }
    [[nodiscard]] static constexpr DesyncDetection off() noexcept { return {}; }

    bool operator==(const DesyncDetection &) const noexcept = default;
};

} // namespace rwn::net::protocol
