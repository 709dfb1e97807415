/**
 * @file FeatureExtractor.hpp
 * @brief Time-domain voice feature extraction.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_BIOMETRIC_FEATURE_EXTRACTOR_HPP
    #define SPC_BIOMETRIC_FEATURE_EXTRACTOR_HPP

    #include <spc/biometric/VoiceFeatures.hpp>
    #include <spc/core/Constants.hpp>
    #include <spc/core/Expected.hpp>
    #include <spc/core/Types.hpp>

    #include <span>
    #include <vector>

namespace spc::biometric {

/**
 * @brief Converts a sample buffer into VoiceFeatures.
 *
 * All features are computed in the time domain:
 * - energy: RMS of the samples
 * - zero-crossing rate: sign changes / length (0 counts as positive)
 * - spectral centroid: sum(i * |x_i|) / sum(|x_i|)
 * - pitch: sampleRate / lag of the strongest positive autocorrelation for
 *   lag in [20, 500) and lag < n / 2
 * - MFCC: log(1 + mean |x|) over 13 equal partitions
 */
class FeatureExtractor final {
public:
    explicit FeatureExtractor(core::u32 sampleRate = core::kDefaultSampleRate) noexcept
        : _sampleRate(sampleRate) {}

    /**
     * @brief Extract features from normalised samples in [-1, 1].
     * @return @c kEmptyInput for an empty buffer, @c kInvalidArgument for
     *         fewer than 13 samples or non-finite values.
     */
    [[nodiscard]] core::Expected<VoiceFeatures> extract(std::span<const float> samples) const;

    /**
     * @brief Extract features from signed 16-bit PCM.
     */
    [[nodiscard]] core::Expected<VoiceFeatures> extract(std::span<const core::i16> pcm) const;

    /**
     * @brief Scale PCM16 samples to [-1, 1) by dividing by 32768.
     */
    [[nodiscard]] static std::vector<float> normalise(std::span<const core::i16> pcm);

    [[nodiscard]] core::u32 sampleRate() const noexcept { return _sampleRate; }

private:
    core::u32 _sampleRate;
};

} // namespace spc::biometric

#endif // SPC_BIOMETRIC_FEATURE_EXTRACTOR_HPP
