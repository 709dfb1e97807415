/**
 * @file TestFeatureExtractor.cpp
 * @brief Unit tests for spc::biometric::FeatureExtractor.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <spc/biometric/FeatureExtractor.hpp>

#include <cmath>
#include <numbers>
#include <vector>

using namespace spc;
using namespace spc::biometric;
using Catch::Matchers::WithinAbs;

namespace {

std::vector<core::i16> sinePcm(double frequencyHz, core::usize n, double amplitude, double sampleRate = 48000.0)
{
    std::vector<core::i16> pcm(n);
    for (core::usize i = 0; i < n; ++i) {
        const double v = amplitude * std::sin(2.0 * std::numbers::pi * frequencyHz * static_cast<double>(i) / sampleRate);
        pcm[i] = static_cast<core::i16>(std::lround(v));
    }
    return pcm;
}

} // namespace

TEST_CASE("FeatureExtractor on a pure tone", "[biometric][features]")
{
    const FeatureExtractor extractor;
    // 26 whole periods, 2 per MFCC bin.
    const auto pcm = sinePcm(480.0, 2600, 16384.0);

    auto res = extractor.extract(std::span<const core::i16>{pcm});
    REQUIRE(res.has_value());

    SECTION("pitch from the autocorrelation peak")
    {
        REQUIRE_THAT(res->pitch, WithinAbs(480.0, 1e-9));
    }

    SECTION("energy is the RMS of the normalised samples")
    {
        REQUIRE_THAT(res->energy, WithinAbs(0.5 / std::sqrt(2.0), 1e-3));
    }

    SECTION("two zero crossings per period")
    {
        REQUIRE_THAT(res->zeroCrossingRate, WithinAbs(0.02, 0.002));
    }

    SECTION("bins are equal for a stationary tone")
    {
        for (Eigen::Index b = 1; b < res->mfcc.size(); ++b)
            REQUIRE_THAT(res->mfcc(b), WithinAbs(res->mfcc(0), 1e-3));
    }
}

TEST_CASE("FeatureExtractor MFCC bins and centroid", "[biometric][features]")
{
    const FeatureExtractor extractor;

    SECTION("constant buffer")
    {
        const std::vector<float> samples(26, 0.5f);
        auto res = extractor.extract(std::span<const float>{samples});
        REQUIRE(res.has_value());
        REQUIRE(res->mfcc.size() == static_cast<Eigen::Index>(core::kMfccBins));
        for (Eigen::Index b = 0; b < res->mfcc.size(); ++b)
            REQUIRE_THAT(res->mfcc(b), WithinAbs(std::log(1.5), 1e-6));
        REQUIRE_THAT(res->zeroCrossingRate, WithinAbs(0.0, 1e-12));
    }

    SECTION("single impulse")
    {
        std::vector<float> samples(64, 0.0f);
        samples[10] = -0.8f;
        auto res = extractor.extract(std::span<const float>{samples});
        REQUIRE(res.has_value());
        REQUIRE_THAT(res->spectralCentroid, WithinAbs(10.0, 1e-9));
        REQUIRE_THAT(res->pitch, WithinAbs(0.0, 1e-12));
    }

    SECTION("silence")
    {
        const std::vector<float> samples(128, 0.0f);
        auto res = extractor.extract(std::span<const float>{samples});
        REQUIRE(res.has_value());
        REQUIRE_THAT(res->energy, WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(res->spectralCentroid, WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(res->pitch, WithinAbs(0.0, 1e-12));
    }
}

TEST_CASE("FeatureExtractor rejects unusable buffers", "[biometric][features]")
{
    const FeatureExtractor extractor;

    const std::vector<float> empty;
    REQUIRE(extractor.extract(std::span<const float>{empty}).error().code() == core::ErrorCode::kEmptyInput);

    const std::vector<float> shortBuffer(5, 0.1f);
    REQUIRE(extractor.extract(std::span<const float>{shortBuffer}).error().code() == core::ErrorCode::kInvalidArgument);

    std::vector<float> nan(32, 0.1f);
    nan[3] = std::nanf("");
    REQUIRE(extractor.extract(std::span<const float>{nan}).error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("PCM16 normalisation", "[biometric][features]")
{
    const std::vector<core::i16> pcm = {-32768, 0, 16384};
    const auto out = FeatureExtractor::normalise(pcm);
    REQUIRE(out.size() == 3);
    REQUIRE_THAT(out[0], WithinAbs(-1.0f, 1e-7f));
    REQUIRE_THAT(out[1], WithinAbs(0.0f, 1e-7f));
    REQUIRE_THAT(out[2], WithinAbs(0.5f, 1e-7f));
}
