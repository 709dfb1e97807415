/**
 * @file BiometricMatcher.cpp
 * @brief BiometricMatcher and Voiceprint implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/biometric/BiometricMatcher.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace spc::biometric {

core::Expected<Voiceprint> Voiceprint::create(std::span<const VoiceFeatures> samples)
{
    if (samples.size() != core::kVoiceprintSamples)
        return core::makeError(core::ErrorCode::kEnrollmentIncomplete,
            std::format("voiceprint needs {} samples, got {}", core::kVoiceprintSamples, samples.size()));

    Samples sealed;
    std::copy(samples.begin(), samples.end(), sealed.begin());
    return Voiceprint{sealed};
}

double BiometricMatcher::similarity(const VoiceFeatures &a, const VoiceFeatures &b) noexcept
{
    const double mfcc = ((a.mfcc - b.mfcc).cwiseAbs().array() + 1.0).inverse().mean();
    const double pitch    = 1.0 / (1.0 + std::abs(a.pitch - b.pitch) / 100.0);
    const double energy   = 1.0 / (1.0 + std::abs(a.energy - b.energy) * 10.0);
    const double centroid = 1.0 / (1.0 + std::abs(a.spectralCentroid - b.spectralCentroid) / 100.0);
    const double zcr      = 1.0 / (1.0 + std::abs(a.zeroCrossingRate - b.zeroCrossingRate) * 100.0);

    const double weighted = mfcc * kMfccWeight + pitch * kPitchWeight + energy * kEnergyWeight
                          + centroid * kCentroidWeight + zcr * kZcrWeight;
    const double total    = kMfccWeight + kPitchWeight + kEnergyWeight + kCentroidWeight + kZcrWeight;
    return weighted / total;
}

double BiometricMatcher::averageSimilarity(
    const VoiceFeatures &probe, std::span<const VoiceFeatures> references) noexcept
{
    if (references.empty())
        return core::kNeutralSimilarity;

    double sum = 0.0;
    for (const auto &ref : references)
        sum += similarity(probe, ref);
    return sum / static_cast<double>(references.size());
}

MatchResult BiometricMatcher::match(const VoiceFeatures &probe, const Voiceprint &voiceprint) noexcept
{
    MatchResult result;
    result.similarity = averageSimilarity(probe, voiceprint.samples());
    result.matched    = result.similarity >= core::kVoiceMatchThreshold;
    return result;
}

} // namespace spc::biometric
