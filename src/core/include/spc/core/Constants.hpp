/**
 * @file Constants.hpp
 * @brief Safety-core compile-time constants.
 *
 * Parameters that decide safety-critical behaviour (windows, thresholds,
 * enrollment sizes) are fixed here and are deliberately not exposed
 * through the runtime configuration.  Per-domain weight and threshold
 * tables live with the domain traits in the fusion module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_CORE_CONSTANTS_HPP
    #define SPC_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <chrono>

namespace spc::core {

// ---- Intent correlation ---------------------------------------------------

inline constexpr auto  kIntentWindow            = std::chrono::minutes{2};
inline constexpr usize kIntentHistoryCapacity   = 50;

// ---- Biometric ------------------------------------------------------------

inline constexpr usize kMfccBins                = 13;
inline constexpr usize kVoiceprintSamples       = 5;
inline constexpr f64   kVoiceMatchThreshold     = 0.75;
inline constexpr f64   kNeutralSimilarity       = 0.5;
inline constexpr usize kPitchMinLag             = 20;
inline constexpr usize kPitchMaxLag             = 500;
inline constexpr u32   kDefaultSampleRate       = 48'000;

// ---- Truth Lock -----------------------------------------------------------

inline constexpr auto  kCancelWindow            = std::chrono::minutes{10};
inline constexpr u32   kDefaultAutoReleaseHours = 24;

// ---- Alert dispatch -------------------------------------------------------

inline constexpr usize kAlertQueueCapacity      = 256;

} // namespace spc::core

#endif // SPC_CORE_CONSTANTS_HPP
