/**
 * @file FeatureExtractor.cpp
 * @brief FeatureExtractor implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/biometric/FeatureExtractor.hpp"

#include <spc/math/Statistics.hpp>

#include <cmath>

namespace spc::biometric {

namespace {

double estimatePitch(std::span<const double> x, core::u32 sampleRate)
{
    const core::usize n = x.size();
    double best  = 0.0;
    double pitch = 0.0;

    for (core::usize lag = core::kPitchMinLag; lag < core::kPitchMaxLag && 2 * lag < n; ++lag) {
        double corr = 0.0;
        for (core::usize i = 0; i + lag < n; ++i)
            corr += x[i] * x[i + lag];

        if (corr > best) {
            best  = corr;
            pitch = static_cast<double>(sampleRate) / static_cast<double>(lag);
        }
    }
    return pitch;
}

MfccVector mfccBins(std::span<const double> x)
{
    const core::usize binSize = x.size() / core::kMfccBins;
    MfccVector out;
    for (core::usize b = 0; b < core::kMfccBins; ++b) {
        double mag = 0.0;
        for (core::usize j = b * binSize; j < (b + 1) * binSize; ++j)
            mag += std::abs(x[j]);
        out(static_cast<Eigen::Index>(b)) = std::log(1.0 + mag / static_cast<double>(binSize));
    }
    return out;
}

} // namespace

core::Expected<VoiceFeatures> FeatureExtractor::extract(std::span<const float> samples) const
{
    if (samples.empty())
        return core::makeError(core::ErrorCode::kEmptyInput, "voice sample buffer is empty");
    if (samples.size() < core::kMfccBins)
        return core::makeError(core::ErrorCode::kInvalidArgument, "voice sample shorter than the MFCC bin count");
    if (_sampleRate == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "sample rate must be positive");

    std::vector<double> x;
    x.reserve(samples.size());
    for (const float s : samples) {
        if (!std::isfinite(s))
            return core::makeError(core::ErrorCode::kInvalidArgument, "voice sample contains a non-finite value");
        x.push_back(static_cast<double>(s));
    }

    VoiceFeatures f;
    f.energy = math::Statistics::rms(x);

    core::usize crossings = 0;
    for (core::usize i = 1; i < x.size(); ++i)
        if ((x[i] >= 0.0) != (x[i - 1] >= 0.0))
            ++crossings;
    f.zeroCrossingRate = static_cast<double>(crossings) / static_cast<double>(x.size());

    double weighted = 0.0;
    double total    = 0.0;
    for (core::usize i = 0; i < x.size(); ++i) {
        const double mag = std::abs(x[i]);
        weighted += static_cast<double>(i) * mag;
        total    += mag;
    }
    f.spectralCentroid = total > 0.0 ? weighted / total : 0.0;

    f.pitch = estimatePitch(x, _sampleRate);
    f.mfcc  = mfccBins(x);
    return f;
}

core::Expected<VoiceFeatures> FeatureExtractor::extract(std::span<const core::i16> pcm) const
{
    const auto samples = normalise(pcm);
    return extract(std::span<const float>{samples});
}

std::vector<float> FeatureExtractor::normalise(std::span<const core::i16> pcm)
{
    std::vector<float> out;
    out.reserve(pcm.size());
    for (const core::i16 s : pcm)
        out.push_back(static_cast<float>(s) / 32768.0f);
    return out;
}

} // namespace spc::biometric
