/**
 * @file Constants.hpp
 * @brief Compile-time defaults of the rollback engine.
 *
 * Session configuration starts from these values; every one of them can
 * be overridden through SessionConfig::Builder except the hard capacity
 * limits (kMaxPlayers, kMaxInputBytes, kMaxDatagramSize).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_CONSTANTS_HPP
    #define RWN_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace rwn::core {

inline constexpr u32   kMaxPlayers                  = 8;
inline constexpr usize kMaxInputBytes               = 32;
inline constexpr usize kMaxDatagramSize             = 2048;

inline constexpr u32   kDefaultFps                  = 60;
inline constexpr u32   kDefaultMaxPrediction        = 8;
inline constexpr u32   kDefaultInputDelay           = 0;
inline constexpr u32   kDefaultQueueLength          = 128;
inline constexpr u32   kDefaultCheckDistance        = 2;
inline constexpr u32   kDefaultDesyncInterval       = 10;

inline constexpr u32   kNumSyncPackets              = 5;
inline constexpr u64   kSyncRetryIntervalMs         = 200;
inline constexpr u64   kRunningRetryIntervalMs      = 200;
inline constexpr u64   kKeepAliveIntervalMs         = 200;
inline constexpr u64   kQualityReportIntervalMs     = 200;
inline constexpr u64   kShutdownDelayMs             = 5000;
inline constexpr u64   kDisconnectTimeoutMs         = 2000;
inline constexpr u64   kDisconnectNotifyStartMs     = 500;
inline constexpr u64   kSyncTimeoutMs               = 0;
inline constexpr u32   kPendingOutputLimit          = 128;
inline constexpr u32   kMaxChecksumHistory          = 32;

inline constexpr u32   kFrameWindowSize             = 30;
inline constexpr u32   kRecommendationInterval      = 60;
inline constexpr i32   kMinRecommendation           = 3;
inline constexpr usize kMaxEventQueueSize           = 100;

inline constexpr u8    kProtocolVersion             = 1;

} // namespace rwn::core

#endif // RWN_CORE_CONSTANTS_HPP
