/**
 * @file Constants.hpp
 * @brief Decoder-wide compile-time constants.
 *
 * @version 0.1.0
 * @copyright MIT License
 */
#pragma once

#ifndef SLP_CORE_CONSTANTS_HPP
    #define SLP_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace slp::core {

inline constexpr i32   kFrameNotStarted        = -10'000;

inline constexpr u8    kMinPort                = 1;
inline constexpr u8    kMaxPort                = 4;
inline constexpr u8    kPortCount              = 4;

inline constexpr usize kDefaultReadChunkSize   = 4096;

inline constexpr u8    kMinimumMajorVersion    = 3;
inline constexpr u8    kMinimumMinorVersion    = 0;
inline constexpr u8    kMinimumRevision        = 0;

inline constexpr i32   kRespawnInvulnFrames    = 120;
inline constexpr i32   kLedgeInvulnFrames      = 36;
inline constexpr i32   kFirstDescentFrameLimit = 150;
inline constexpr f32   kOffStageHeight         = -6.0f;

} // namespace slp::core

#endif // SLP_CORE_CONSTANTS_HPP
