/**
 * @file TestScreamClassifier.cpp
 * @brief Unit tests for spc::intent::ScreamClassifier.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <spc/intent/ScreamClassifier.hpp>

#include <chrono>
#include <limits>

using namespace spc;
using namespace spc::intent;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

const core::TimePoint kT0 = core::fromEpochMillis(1'700'000'000'000);

} // namespace

TEST_CASE("Quiet low frames score nothing", "[intent][scream]")
{
    ScreamClassifier classifier;
    auto res = classifier.analyze({0.2, 300.0}, kT0);
    REQUIRE(res.has_value());
    REQUIRE_THAT(res->confidence, WithinAbs(0.0, 1e-9));
    REQUIRE_FALSE(res->detected);
}

TEST_CASE("Volume and band contributions", "[intent][scream]")
{
    ScreamClassifier classifier;
    // 30*0.8 + 30*(2500-1000)/3000
    auto res = classifier.analyze({0.8, 2500.0}, kT0);
    REQUIRE(res.has_value());
    REQUIRE_THAT(res->confidence, WithinAbs(39.0, 1e-9));
}

TEST_CASE("Sustained panicked scream is detected", "[intent][scream]")
{
    ScreamClassifier classifier;
    auto t = kT0;

    REQUIRE(classifier.analyze({0.95, 1200.0}, t).has_value());
    t += 300ms;
    REQUIRE(classifier.analyze({0.95, 3800.0}, t).has_value());
    t += 300ms;
    auto res = classifier.analyze({0.95, 3900.0}, t);
    REQUIRE(res.has_value());
    // 28.5 volume + 29 band + 20 pitch spread + 20 duration, capped
    REQUIRE(res->confidence >= 75.0);
    REQUIRE(res->detected);
}

TEST_CASE("Duration bonus resets when the sound stops", "[intent][scream]")
{
    ScreamClassifier classifier;

    REQUIRE(classifier.analyze({0.9, 2000.0}, kT0).has_value());
    REQUIRE(classifier.analyze({0.1, 2000.0}, kT0 + 300ms).has_value());
    auto res = classifier.analyze({0.9, 2000.0}, kT0 + 900ms);
    REQUIRE(res.has_value());
    // 27 + 10, frequencies are flat and the scream restarted
    REQUIRE_THAT(res->confidence, WithinAbs(37.0, 1e-9));
}

TEST_CASE("Invalid frames are rejected", "[intent][scream]")
{
    ScreamClassifier classifier;
    REQUIRE(classifier.analyze({-0.1, 1000.0}, kT0).error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(classifier.analyze({0.5, std::numeric_limits<double>::infinity()}, kT0).error().code()
            == core::ErrorCode::kInvalidArgument);
}
