/**
 * @file ScreamClassifier.hpp
 * @brief Scores reduced audio frames for distress vocalisation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_INTENT_SCREAM_CLASSIFIER_HPP
    #define SPC_INTENT_SCREAM_CLASSIFIER_HPP

    #include <spc/core/Clock.hpp>
    #include <spc/core/Expected.hpp>
    #include <spc/core/Types.hpp>

    #include <deque>
    #include <mutex>
    #include <optional>

namespace spc::intent {

/**
 * @brief One analysis frame already reduced by the capture collaborator.
 */
struct ScreamFrame {
    /// RMS volume, nominally 0..1.
    double volume = 0.0;
    double dominantFrequencyHz = 0.0;
};

struct ScreamResult {
    /// 0..100.
    double confidence = 0.0;
    /// confidence >= 75.
    bool   detected = false;
};

/**
 * @brief Heuristic scream detector.
 *
 * Contributions, capped at 100:
 * - volume above 0.7: 30 x volume
 * - dominant frequency in [1000, 4000] Hz: 30 x position inside the band
 * - standard deviation of the last 10 frequencies above 200 Hz:
 *   20 x min(1, sigma / 500)
 * - loud high-pitched sound sustained for more than 500 ms: 20
 */
class ScreamClassifier final {
public:
    static constexpr double      kVolumeThreshold   = 0.7;
    static constexpr double      kFrequencyMin      = 1000.0;
    static constexpr double      kFrequencyMax      = 4000.0;
    static constexpr double      kPanicPitchSigma   = 200.0;
    static constexpr auto        kMinDuration       = std::chrono::milliseconds{500};
    static constexpr core::usize kFrequencyHistory  = 10;
    static constexpr double      kDetectionScore    = 75.0;

    /**
     * @brief Score one frame captured at @p at.
     * @return @c kInvalidArgument for negative or non-finite inputs.
     */
    [[nodiscard]] core::Expected<ScreamResult> analyze(const ScreamFrame &frame, core::TimePoint at);

    void reset();

private:
    mutable std::mutex              _mutex;
    std::deque<double>              _frequencies;
    std::optional<core::TimePoint>  _screamStart;
};

} // namespace spc::intent

#endif // SPC_INTENT_SCREAM_CLASSIFIER_HPP
