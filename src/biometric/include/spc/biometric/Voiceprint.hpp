/**
 * @file Voiceprint.hpp
 * @brief Immutable set of enrolled reference feature vectors.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_BIOMETRIC_VOICEPRINT_HPP
    #define SPC_BIOMETRIC_VOICEPRINT_HPP

    #include <spc/biometric/VoiceFeatures.hpp>
    #include <spc/core/Constants.hpp>
    #include <spc/core/Expected.hpp>

    #include <array>
    #include <span>

namespace spc::biometric {

/**
 * @brief Exactly five enrollment samples, in enrollment order.
 *
 * Only create() builds a Voiceprint, so every instance is complete.
 */
class Voiceprint final {
public:
    using Samples = std::array<VoiceFeatures, core::kVoiceprintSamples>;

    /**
     * @brief Seal a voiceprint from enrollment samples.
     * @return @c kEnrollmentIncomplete unless exactly five samples are given.
     */
    [[nodiscard]] static core::Expected<Voiceprint> create(std::span<const VoiceFeatures> samples);

    [[nodiscard]] const Samples &samples() const noexcept { return _samples; }

private:
    explicit Voiceprint(const Samples &samples) : _samples(samples) {}

    Samples _samples;
};

} // namespace spc::biometric

#endif // SPC_BIOMETRIC_VOICEPRINT_HPP
