/**
 * @file TestVoiceprintEnrollment.cpp
 * @brief Unit tests for spc::biometric::VoiceprintEnrollment.
 */

#include <catch2/catch_test_macros.hpp>

#include <spc/biometric/VoiceprintEnrollment.hpp>

#include <atomic>
#include <cmath>
#include <latch>
#include <numbers>
#include <span>
#include <thread>
#include <vector>

using namespace spc;
using namespace spc::biometric;

namespace {

class ToneSource final : public ISampleSource {
public:
    explicit ToneSource(double frequencyHz) : _frequencyHz(frequencyHz) {}

    core::Expected<std::vector<core::i16>> capture() override
    {
        ++calls;
        std::vector<core::i16> pcm(4800);
        for (core::usize i = 0; i < pcm.size(); ++i) {
            const double t = static_cast<double>(i) / 48000.0;
            pcm[i] = static_cast<core::i16>(std::lround(8000.0 * std::sin(2.0 * std::numbers::pi * _frequencyHz * t)));
        }
        return pcm;
    }

    int calls = 0;

private:
    double _frequencyHz;
};

class UnavailableSource final : public ISampleSource {
public:
    core::Expected<std::vector<core::i16>> capture() override
    {
        return core::makeError(core::ErrorCode::kResourceUnavailable, "microphone permission denied");
    }
};

void enroll(VoiceprintEnrollment &enrollment, ToneSource &source)
{
    for (core::usize i = 0; i < core::kVoiceprintSamples; ++i)
        REQUIRE(enrollment.recordSample(source).has_value());
    REQUIRE(enrollment.createVoiceprint().has_value());
}

} // namespace

TEST_CASE("Enrollment seals five samples into a voiceprint", "[biometric][enrollment]")
{
    ToneSource source{220.0};
    VoiceprintEnrollment enrollment;

    for (core::usize i = 0; i < core::kVoiceprintSamples - 1; ++i)
        REQUIRE(enrollment.recordSample(source).has_value());
    REQUIRE(enrollment.sampleCount() == 4);

    auto early = enrollment.createVoiceprint();
    REQUIRE_FALSE(early.has_value());
    REQUIRE(early.error().code() == core::ErrorCode::kEnrollmentIncomplete);

    REQUIRE(enrollment.recordSample(source).has_value());

    auto extra = source.capture();
    REQUIRE(extra.has_value());
    const auto features = FeatureExtractor{}.extract(std::span<const core::i16>{*extra});
    REQUIRE(features.has_value());
    REQUIRE(enrollment.addSample(*features).error().code() == core::ErrorCode::kInvalidState);

    REQUIRE(enrollment.createVoiceprint().has_value());
    REQUIRE(enrollment.hasVoiceprint());
    REQUIRE(enrollment.voiceprint().has_value());

    REQUIRE(enrollment.createVoiceprint().error().code() == core::ErrorCode::kAlreadyEnrolled);
    REQUIRE(enrollment.addSample(*features).error().code() == core::ErrorCode::kAlreadyEnrolled);
}

TEST_CASE("Matching before enrollment reports kNotEnrolled", "[biometric][enrollment]")
{
    VoiceprintEnrollment enrollment;
    ToneSource source{220.0};

    auto res = enrollment.verify(source);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code() == core::ErrorCode::kNotEnrolled);
}

TEST_CASE("Verification accepts the enrolled voice", "[biometric][enrollment]")
{
    ToneSource source{220.0};
    VoiceprintEnrollment enrollment;
    enroll(enrollment, source);

    auto same = enrollment.verify(source);
    REQUIRE(same.has_value());
    REQUIRE(same->matched);
    REQUIRE(same->similarity > 0.99);

    auto pcm = source.capture();
    REQUIRE(pcm.has_value());
    auto direct = enrollment.matchVoice(std::span<const core::i16>{*pcm});
    REQUIRE(direct.has_value());
    REQUIRE(direct->similarity == same->similarity);

    ToneSource other{1900.0};
    auto different = enrollment.verify(other);
    REQUIRE(different.has_value());
    REQUIRE(different->similarity < same->similarity);
}

TEST_CASE("Capture failures surface unchanged and are not retried", "[biometric][enrollment]")
{
    VoiceprintEnrollment enrollment;
    UnavailableSource source;

    auto res = enrollment.recordSample(source);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code() == core::ErrorCode::kResourceUnavailable);
    REQUIRE(enrollment.sampleCount() == 0);
}

TEST_CASE("Reset discards the voiceprint", "[biometric][enrollment]")
{
    ToneSource source{220.0};
    VoiceprintEnrollment enrollment;
    enroll(enrollment, source);
    const auto saved = enrollment.voiceprint();
    REQUIRE(saved.has_value());

    enrollment.reset();
    REQUIRE_FALSE(enrollment.hasVoiceprint());
    REQUIRE(enrollment.sampleCount() == 0);

    REQUIRE(enrollment.loadVoiceprint(*saved).has_value());
    REQUIRE(enrollment.hasVoiceprint());
    REQUIRE(enrollment.loadVoiceprint(*saved).error().code() == core::ErrorCode::kAlreadyEnrolled);
}

TEST_CASE("Concurrent enrollment never exceeds five samples", "[biometric][enrollment][concurrency]")
{
    ToneSource source{220.0};
    auto pcm = source.capture();
    REQUIRE(pcm.has_value());
    const auto features = FeatureExtractor{}.extract(std::span<const core::i16>{*pcm});
    REQUIRE(features.has_value());

    VoiceprintEnrollment enrollment;

    constexpr int kAdders = 12;
    std::latch       go{kAdders};
    std::atomic<int> accepted{0};
    std::atomic<int> refused{0};
    std::atomic<int> unexpectedErrors{0};

    std::vector<std::thread> adders;
    for (int i = 0; i < kAdders; ++i) {
        adders.emplace_back([&] {
            go.arrive_and_wait();
            auto added = enrollment.addSample(*features);
            if (added)
                ++accepted;
            else if (added.error().code() == core::ErrorCode::kInvalidState)
                ++refused;
            else
                ++unexpectedErrors;
        });
    }
    for (auto &t : adders)
        t.join();

    REQUIRE(unexpectedErrors.load() == 0);
    REQUIRE(accepted.load() == static_cast<int>(core::kVoiceprintSamples));
    REQUIRE(refused.load() == kAdders - static_cast<int>(core::kVoiceprintSamples));
    REQUIRE(enrollment.sampleCount() == core::kVoiceprintSamples);

    constexpr int kCreators = 4;
    std::latch       sealGo{kCreators};
    std::atomic<int> created{0};
    std::atomic<int> alreadyEnrolled{0};

    std::vector<std::thread> creators;
    for (int i = 0; i < kCreators; ++i) {
        creators.emplace_back([&] {
            sealGo.arrive_and_wait();
            auto voiceprint = enrollment.createVoiceprint();
            if (voiceprint)
                ++created;
            else if (voiceprint.error().code() == core::ErrorCode::kAlreadyEnrolled)
                ++alreadyEnrolled;
        });
    }
    for (auto &t : creators)
        t.join();

    REQUIRE(created.load() == 1);
    REQUIRE(alreadyEnrolled.load() == kCreators - 1);
    REQUIRE(enrollment.hasVoiceprint());
}
