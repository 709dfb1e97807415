/**
 * @file BiometricMatcher.hpp
 * @brief Weighted similarity between voice feature vectors.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_BIOMETRIC_BIOMETRIC_MATCHER_HPP
    #define SPC_BIOMETRIC_BIOMETRIC_MATCHER_HPP

    #include <spc/biometric/VoiceFeatures.hpp>
    #include <spc/biometric/Voiceprint.hpp>
    #include <spc/core/Constants.hpp>

    #include <span>

namespace spc::biometric {

struct MatchResult {
    double similarity = 0.0;
    bool   matched    = false;
};

/**
 * @brief Best-effort heuristic voice comparison.
 *
 * Per-feature similarities of the form 1 / (1 + scaled |delta|) are
 * combined with weights MFCC 0.4, pitch 0.25, energy 0.15, centroid 0.1
 * and zero-crossing rate 0.1.  A probe is compared with every reference
 * and the similarities are averaged, so one inconsistent enrollment
 * sample lowers the score instead of being ignored.
 */
class BiometricMatcher final {
public:
    static constexpr double kMfccWeight     = 0.4;
    static constexpr double kPitchWeight    = 0.25;
    static constexpr double kEnergyWeight   = 0.15;
    static constexpr double kCentroidWeight = 0.1;
    static constexpr double kZcrWeight      = 0.1;

    BiometricMatcher() = delete;

    /// @brief Similarity of two vectors in [0, 1].
    [[nodiscard]] static double similarity(const VoiceFeatures &a, const VoiceFeatures &b) noexcept;

    /// @brief Mean similarity against @p references; 0.5 when there are none.
    [[nodiscard]] static double averageSimilarity(
        const VoiceFeatures &probe, std::span<const VoiceFeatures> references) noexcept;

    /// @brief Compare a probe with a voiceprint against the 0.75 threshold.
    [[nodiscard]] static MatchResult match(const VoiceFeatures &probe, const Voiceprint &voiceprint) noexcept;
};

} // namespace spc::biometric

#endif // SPC_BIOMETRIC_BIOMETRIC_MATCHER_HPP
