/**
 * @file TestBiometricMatcher.cpp
 * @brief Unit tests for BiometricMatcher and Voiceprint.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <spc/biometric/BiometricMatcher.hpp>

#include <random>
#include <vector>

using namespace spc;
using namespace spc::biometric;
using Catch::Matchers::WithinAbs;

namespace {

VoiceFeatures baseFeatures()
{
    VoiceFeatures f;
    for (Eigen::Index b = 0; b < f.mfcc.size(); ++b)
        f.mfcc(b) = 0.2 + 0.05 * static_cast<double>(b);
    f.pitch            = 180.0;
    f.energy           = 0.12;
    f.spectralCentroid = 1020.0;
    f.zeroCrossingRate = 0.04;
    return f;
}

VoiceFeatures perturbed(const VoiceFeatures &base, double delta)
{
    VoiceFeatures f = base;
    f.mfcc.array() += delta;
    f.pitch            += delta * 100.0;
    f.energy           += delta * 0.1;
    f.spectralCentroid += delta * 100.0;
    f.zeroCrossingRate += delta * 0.01;
    return f;
}

VoiceFeatures randomFeatures(std::mt19937 &rng)
{
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    VoiceFeatures f;
    for (Eigen::Index b = 0; b < f.mfcc.size(); ++b)
        f.mfcc(b) = 5.0 * unit(rng);
    f.pitch            = 80.0 + 2320.0 * unit(rng);
    f.energy           = unit(rng);
    f.spectralCentroid = 24000.0 * unit(rng);
    f.zeroCrossingRate = 0.5 * unit(rng);
    return f;
}

} // namespace

TEST_CASE("Identical features are fully similar", "[biometric][matcher]")
{
    const auto f = baseFeatures();
    REQUIRE_THAT(BiometricMatcher::similarity(f, f), WithinAbs(1.0, 1e-12));
}

TEST_CASE("Similarity weights the feature terms", "[biometric][matcher]")
{
    const auto a = baseFeatures();
    auto b = a;
    b.pitch += 100.0; // pitch term drops to 0.5

    REQUIRE_THAT(BiometricMatcher::similarity(a, b), WithinAbs(1.0 - 0.25 * 0.5, 1e-12));
}

TEST_CASE("Probe matches a consistent voiceprint", "[biometric][matcher]")
{
    const auto probe = baseFeatures();
    const std::vector<VoiceFeatures> refs = {
        probe,
        perturbed(probe, 0.01),
        perturbed(probe, -0.02),
        perturbed(probe, 0.015),
        perturbed(probe, -0.01),
    };

    auto voiceprint = Voiceprint::create(refs);
    REQUIRE(voiceprint.has_value());

    const auto result = BiometricMatcher::match(probe, *voiceprint);
    REQUIRE(result.similarity >= core::kVoiceMatchThreshold);
    REQUIRE(result.matched);
}

TEST_CASE("Unrelated random features do not match", "[biometric][matcher]")
{
    std::mt19937 rng{1234u};
    int matches = 0;

    for (int trial = 0; trial < 100; ++trial) {
        std::vector<VoiceFeatures> refs;
        for (core::usize i = 0; i < core::kVoiceprintSamples; ++i)
            refs.push_back(randomFeatures(rng));
        auto voiceprint = Voiceprint::create(refs);
        REQUIRE(voiceprint.has_value());

        if (BiometricMatcher::match(randomFeatures(rng), *voiceprint).matched)
            ++matches;
    }
    REQUIRE(matches <= 5);
}

TEST_CASE("Empty reference set yields the neutral similarity", "[biometric][matcher]")
{
    REQUIRE_THAT(BiometricMatcher::averageSimilarity(baseFeatures(), {}), WithinAbs(0.5, 1e-12));
}

TEST_CASE("Averaging penalises one inconsistent reference", "[biometric][matcher]")
{
    const auto probe = baseFeatures();
    std::vector<VoiceFeatures> refs(4, probe);
    std::mt19937 rng{7u};
    refs.push_back(randomFeatures(rng));

    const double avg = BiometricMatcher::averageSimilarity(probe, refs);
    REQUIRE(avg < 1.0);
    REQUIRE(avg > 0.8);
}

TEST_CASE("Voiceprint requires exactly five samples", "[biometric][voiceprint]")
{
    const std::vector<VoiceFeatures> four(4, baseFeatures());
    auto res = Voiceprint::create(four);
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error().code() == core::ErrorCode::kEnrollmentIncomplete);

    const std::vector<VoiceFeatures> six(6, baseFeatures());
    REQUIRE(Voiceprint::create(six).error().code() == core::ErrorCode::kEnrollmentIncomplete);
}
