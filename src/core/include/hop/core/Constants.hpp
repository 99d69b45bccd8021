/**
 * @file Constants.hpp
 * @brief Engine-wide compile-time constants.
 *
 * Page geometry, wire limits and the default timing budgets for migration
 * retries and liveness monitoring are centralised here so that a single
 * header controls the engine's fundamental operating parameters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef HOP_CORE_CONSTANTS_HPP
    #define HOP_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace hop::core {

inline constexpr usize kPageSize                  = 64 * 1024;
inline constexpr u64   kDefaultMaxMemoryPages      = 65'536;

inline constexpr u32   kMaxMessageSize            = 150 * 1024 * 1024;
inline constexpr usize kRecentMigrationCapacity   = 64;

inline constexpr u32   kMigrationMaxAttempts      = 5;
inline constexpr u32   kMigrationInitialBackoffMs = 200;
inline constexpr u32   kMigrationMaxBackoffMs     = 2'000;
inline constexpr u32   kMigrationAckTimeoutMs     = 60'000;

inline constexpr u32   kHeartbeatIntervalMs       = 1'000;
inline constexpr u32   kHeartbeatMissThreshold    = 5;
inline constexpr u32   kControlTimeoutMs          = 2'000;

inline constexpr u32   kReadinessTimeoutMs        = 30'000;
inline constexpr u32   kReadinessInitialBackoffMs = 250;
inline constexpr u32   kReadinessMaxBackoffMs     = 2'000;

inline constexpr u32   kInboundWorkerThreads      = 4;

} // namespace hop::core

#endif // HOP_CORE_CONSTANTS_HPP
