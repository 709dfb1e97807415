/**
 * @file VoiceFeatures.hpp
 * @brief Fixed voice feature vector.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_BIOMETRIC_VOICE_FEATURES_HPP
    #define SPC_BIOMETRIC_VOICE_FEATURES_HPP

    #include <spc/core/Constants.hpp>

    #include <Eigen/Dense>

namespace spc::biometric {

/// @brief 13 log-magnitude bins over equal partitions of the buffer.
using MfccVector = Eigen::Matrix<double, static_cast<int>(core::kMfccBins), 1>;

/**
 * @brief Features of one audio sample.  Built once, never mutated.
 */
struct VoiceFeatures {
    MfccVector mfcc             = MfccVector::Zero();
    /// Hz, 0 when no positive autocorrelation peak was found.
    double     pitch            = 0.0;
    /// RMS of the normalised samples.
    double     energy           = 0.0;
    /// Index-weighted centroid of absolute magnitudes.
    double     spectralCentroid = 0.0;
    double     zeroCrossingRate = 0.0;
};

} // namespace spc::biometric

#endif // SPC_BIOMETRIC_VOICE_FEATURES_HPP
