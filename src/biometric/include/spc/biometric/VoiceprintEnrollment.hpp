// /////////////////////////////////////////////////////////////////////////////
/// @file VoiceprintEnrollment.hpp
/// @brief Enrollment and verification of the user's voiceprint.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <spc/biometric/BiometricMatcher.hpp>
#include <spc/biometric/FeatureExtractor.hpp>
#include <spc/biometric/ISampleSource.hpp>
#include <spc/biometric/Voiceprint.hpp>
#include <spc/core/Expected.hpp>
#include <spc/core/NonCopyable.hpp>

#include <mutex>
#include <optional>
#include <span>
#include <vector>

namespace spc::biometric {

// /////////////////////////////////////////////////////////////////////////////
/// @class VoiceprintEnrollment
/// @brief Collects five samples, seals them into a Voiceprint, then
///        verifies probes against it.
///
/// Finalisation is one-way: once a voiceprint exists, samples are
/// rejected with @c kAlreadyEnrolled until @ref reset.  All operations
/// are serialised by an internal mutex.
// /////////////////////////////////////////////////////////////////////////////
class VoiceprintEnrollment final : public core::NonCopyable<VoiceprintEnrollment>
{
public:
    explicit VoiceprintEnrollment(FeatureExtractor extractor = FeatureExtractor{});

    // --------------------------------------------------------------------- //
    //  Enrollment                                                            //
    // --------------------------------------------------------------------- //

    /// @brief Capture one utterance from @p source and add its features.
    /// @return The features, or the source's error unchanged.
    [[nodiscard]] core::Expected<VoiceFeatures> recordSample(ISampleSource &source);

    /// @brief Add already-extracted features.
    /// @return @c kAlreadyEnrolled after finalisation, @c kInvalidState
    ///         when five samples are already held.
    [[nodiscard]] core::ExpectedVoid addSample(const VoiceFeatures &features);

    /// @brief Seal the five collected samples.
    /// @return @c kEnrollmentIncomplete with fewer than five samples,
    ///         @c kAlreadyEnrolled when a voiceprint already exists.
    [[nodiscard]] core::Expected<Voiceprint> createVoiceprint();

    /// @brief Install a previously persisted voiceprint.
    [[nodiscard]] core::ExpectedVoid loadVoiceprint(const Voiceprint &voiceprint);

    // --------------------------------------------------------------------- //
    //  Verification                                                          //
    // --------------------------------------------------------------------- //

    /// @return @c kNotEnrolled without a voiceprint.
    [[nodiscard]] core::Expected<MatchResult> matchVoice(const VoiceFeatures &probe) const;
    [[nodiscard]] core::Expected<MatchResult> matchVoice(std::span<const core::i16> pcm) const;

    /// @brief Capture a probe from @p source and match it.
    [[nodiscard]] core::Expected<MatchResult> verify(ISampleSource &source) const;

    // --------------------------------------------------------------------- //
    //  State                                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::usize sampleCount() const;
    [[nodiscard]] bool hasVoiceprint() const;
    [[nodiscard]] std::optional<Voiceprint> voiceprint() const;

    /// @brief Discard samples and voiceprint.
    void reset();

private:
    [[nodiscard]] core::ExpectedVoid addSampleLocked(const VoiceFeatures &features);
    [[nodiscard]] core::Expected<MatchResult> matchLocked(const VoiceFeatures &probe) const;

    FeatureExtractor              extractor_;
    mutable std::mutex            mutex_;
    std::vector<VoiceFeatures>    samples_;
    std::optional<Voiceprint>     voiceprint_;
};

} // namespace spc::biometric
