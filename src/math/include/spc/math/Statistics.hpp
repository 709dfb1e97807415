/**
 * @file Statistics.hpp
 * @brief Statistical utilities for sensor heuristics and audio features.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_MATH_STATISTICS_HPP
    #define SPC_MATH_STATISTICS_HPP

    #include <spc/core/Types.hpp>

    #include <span>

namespace spc::math {

/**
 * @brief Mean, variance and RMS helpers shared by the coercion
 *        heuristics, the scream classifier and the voice feature
 *        extractor.  Variances are population variances.
 */
class Statistics final {
public:
    Statistics() = delete;

    /**
     * @brief Arithmetic mean.
     * @param samples Input values.
     * @return Mean, or 0 for an empty span.
     */
    [[nodiscard]] static double mean(std::span<const double> samples);

    /**
     * @brief Population variance around the mean.
     * @param samples Input values.
     * @return Variance, or 0 for an empty span.
     */
    [[nodiscard]] static double variance(std::span<const double> samples);

    /**
     * @brief Root mean square.
     * @param samples Input values.
     * @return RMS, or 0 for an empty span.
     */
    [[nodiscard]] static double rms(std::span<const double> samples);

    /**
     * @brief Compute baseline mean and standard deviation.
     * @param samples   Calibration samples.
     * @param[out] mean Output mean.
     * @param[out] stddev Output standard deviation.
     */
    static void computeBaseline(
        std::span<const double> samples,
        double &mean,
        double &stddev
    );
};

} // namespace spc::math

#endif // SPC_MATH_STATISTICS_HPP
