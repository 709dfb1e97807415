/**
 * @file Statistics.cpp
 * @brief Implementation of statistical utilities.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/math/Statistics.hpp"

#include <cmath>

namespace spc::math {

double Statistics::mean(std::span<const double> samples)
{
    if (samples.empty())
        return 0.0;

    double sum = 0.0;
    for (auto s : samples)
        sum += s;
    return sum / static_cast<double>(samples.size());
}

double Statistics::variance(std::span<const double> samples)
{
    if (samples.empty())
        return 0.0;

    const double m = mean(samples);
    double varSum = 0.0;
    for (auto s : samples) {
        const double d = s - m;
        varSum += d * d;
    }
    return varSum / static_cast<double>(samples.size());
}

double Statistics::rms(std::span<const double> samples)
{
    if (samples.empty())
        return 0.0;

    double sumSq = 0.0;
    for (auto s : samples)
        sumSq += s * s;
    return std::sqrt(sumSq / static_cast<double>(samples.size()));
}

void Statistics::computeBaseline(
    std::span<const double> samples,
    double &mean,
    double &stddev
) {
    if (samples.empty()) {
        mean   = 0.0;
        stddev = 0.0;
        return;
    }

    mean   = Statistics::mean(samples);
    stddev = std::sqrt(Statistics::variance(samples));
}

} // namespace spc::math
