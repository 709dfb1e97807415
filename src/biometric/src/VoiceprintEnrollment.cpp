// /////////////////////////////////////////////////////////////////////////////
/// @file VoiceprintEnrollment.cpp
/// @brief VoiceprintEnrollment implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <spc/biometric/VoiceprintEnrollment.hpp>
#include <spc/core/Log.hpp>

#include <format>

namespace spc::biometric {

VoiceprintEnrollment::VoiceprintEnrollment(FeatureExtractor extractor)
    : extractor_{extractor}
{
}

// -------------------------------------------------------------------------- //
//  Enrollment                                                                //
// -------------------------------------------------------------------------- //

core::Expected<VoiceFeatures> VoiceprintEnrollment::recordSample(ISampleSource &source)
{
    auto pcm = source.capture();
    if (!pcm)
    {
        core::Log::warn("VOICE", std::format("sample capture failed: {}", pcm.error().format()));
        return std::unexpected(std::move(pcm.error()));
    }

    auto features = SPC_TRY(extractor_.extract(std::span<const core::i16>{*pcm}));

    std::lock_guard<std::mutex> lock{mutex_};
    SPC_TRY_VOID(addSampleLocked(features));
    return features;
}

core::ExpectedVoid VoiceprintEnrollment::addSample(const VoiceFeatures &features)
{
    std::lock_guard<std::mutex> lock{mutex_};
    return addSampleLocked(features);
}

core::Expected<Voiceprint> VoiceprintEnrollment::createVoiceprint()
{
    std::lock_guard<std::mutex> lock{mutex_};

    if (voiceprint_)
        return core::makeError(core::ErrorCode::kAlreadyEnrolled, "voiceprint already created");

    auto created = Voiceprint::create(samples_);
    if (!created)
        return std::unexpected(std::move(created.error()));

    voiceprint_ = *created;
    samples_.clear();
    core::Log::info("VOICE", "voiceprint created");
    return created;
}

core::ExpectedVoid VoiceprintEnrollment::loadVoiceprint(const Voiceprint &voiceprint)
{
    std::lock_guard<std::mutex> lock{mutex_};

    if (voiceprint_)
        return core::makeError(core::ErrorCode::kAlreadyEnrolled, "voiceprint already present");

    voiceprint_ = voiceprint;
    samples_.clear();
    core::Log::info("VOICE", "voiceprint loaded");
    return {};
}

// -------------------------------------------------------------------------- //
//  Verification                                                              //
// -------------------------------------------------------------------------- //

core::Expected<MatchResult> VoiceprintEnrollment::matchVoice(const VoiceFeatures &probe) const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return matchLocked(probe);
}

core::Expected<MatchResult> VoiceprintEnrollment::matchVoice(std::span<const core::i16> pcm) const
{
    auto probe = SPC_TRY(extractor_.extract(pcm));
    return matchVoice(probe);
}

core::Expected<MatchResult> VoiceprintEnrollment::verify(ISampleSource &source) const
{
    auto pcm = source.capture();
    if (!pcm)
    {
        core::Log::warn("VOICE", std::format("probe capture failed: {}", pcm.error().format()));
        return std::unexpected(std::move(pcm.error()));
    }
    return matchVoice(std::span<const core::i16>{*pcm});
}

// -------------------------------------------------------------------------- //
//  State                                                                     //
// -------------------------------------------------------------------------- //

core::usize VoiceprintEnrollment::sampleCount() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return samples_.size();
}

bool VoiceprintEnrollment::hasVoiceprint() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return voiceprint_.has_value();
}

std::optional<Voiceprint> VoiceprintEnrollment::voiceprint() const
{
    std::lock_guard<std::mutex> lock{mutex_};
    return voiceprint_;
}

void VoiceprintEnrollment::reset()
{
    std::lock_guard<std::mutex> lock{mutex_};
    samples_.clear();
    voiceprint_.reset();
    core::Log::info("VOICE", "enrollment reset");
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

core::ExpectedVoid VoiceprintEnrollment::addSampleLocked(const VoiceFeatures &features)
{
    if (voiceprint_)
        return core::makeError(core::ErrorCode::kAlreadyEnrolled, "voiceprint already created, reset to re-enroll");

    if (samples_.size() >= core::kVoiceprintSamples)
        return core::makeError(core::ErrorCode::kInvalidState,
            std::format("enrollment already holds {} samples", core::kVoiceprintSamples));

    samples_.push_back(features);
    core::Log::info("VOICE", std::format("enrollment sample {}/{}", samples_.size(), core::kVoiceprintSamples));
    return {};
}

core::Expected<MatchResult> VoiceprintEnrollment::matchLocked(const VoiceFeatures &probe) const
{
    if (!voiceprint_)
        return core::makeError(core::ErrorCode::kNotEnrolled, "no voiceprint enrolled");

    const MatchResult result = BiometricMatcher::match(probe, *voiceprint_);
    core::Log::debug("VOICE", std::format("match similarity {:.3f} ({})",
        result.similarity, result.matched ? "match" : "no match"));
    return result;
}

} // namespace spc::biometric
