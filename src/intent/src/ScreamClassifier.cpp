/**
 * @file ScreamClassifier.cpp
 * @brief ScreamClassifier implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/intent/ScreamClassifier.hpp"

#include <spc/core/Log.hpp>
#include <spc/math/Statistics.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <vector>

namespace spc::intent {

core::Expected<ScreamResult> ScreamClassifier::analyze(const ScreamFrame &frame, core::TimePoint at)
{
    if (!std::isfinite(frame.volume) || !std::isfinite(frame.dominantFrequencyHz)
        || frame.volume < 0.0 || frame.dominantFrequencyHz < 0.0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "scream frame must be finite and non-negative");

    std::lock_guard<std::mutex> lock{_mutex};

    _frequencies.push_back(frame.dominantFrequencyHz);
    if (_frequencies.size() > kFrequencyHistory)
        _frequencies.pop_front();

    double sigma = 0.0;
    if (_frequencies.size() >= 2) {
        const std::vector<double> history(_frequencies.begin(), _frequencies.end());
        double mean = 0.0;
        math::Statistics::computeBaseline(history, mean, sigma);
    }

    const bool loudAndHigh = frame.volume > kVolumeThreshold && frame.dominantFrequencyHz > kFrequencyMin;
    if (!loudAndHigh)
        _screamStart.reset();
    else if (!_screamStart)
        _screamStart = at;

    double confidence = 0.0;
    if (frame.volume > kVolumeThreshold)
        confidence += 30.0 * frame.volume;

    if (frame.dominantFrequencyHz >= kFrequencyMin && frame.dominantFrequencyHz <= kFrequencyMax)
        confidence += 30.0 * (frame.dominantFrequencyHz - kFrequencyMin) / (kFrequencyMax - kFrequencyMin);

    if (sigma > kPanicPitchSigma)
        confidence += 20.0 * std::min(1.0, sigma / 500.0);

    if (_screamStart && at - *_screamStart > kMinDuration)
        confidence += 20.0;

    ScreamResult result;
    result.confidence = std::min(100.0, confidence);
    result.detected   = result.confidence >= kDetectionScore;

    if (result.detected)
        core::Log::info("INTENT", std::format("scream detected ({:.0f}% confidence)", result.confidence));
    return result;
}

void ScreamClassifier::reset()
{
    std::lock_guard<std::mutex> lock{_mutex};
    _frequencies.clear();
    _screamStart.reset();
}

} // namespace spc::intent
