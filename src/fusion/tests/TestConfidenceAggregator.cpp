/**
 * @file TestConfidenceAggregator.cpp
 * @brief Unit tests for the decaying weighted-sum aggregator.
 */

#include <catch2/catch_test_macros.hpp>

#include <spc/fusion/ConfidenceAggregator.hpp>

#include <chrono>
#include <cmath>
#include <limits>

using namespace spc;
using namespace spc::fusion;
using namespace std::chrono_literals;

namespace {

const core::TimePoint kT0 = core::fromEpochMillis(1'700'000'000'000);

} // namespace

TEST_CASE("Empty history scores zero at the lowest level", "[fusion][aggregator]")
{
    ConfidenceAggregator<CoercionTraits> agg;
    const auto state = agg.evaluate(kT0);
    REQUIRE(state.score == 0);
    REQUIRE(state.level == CoercionLevel::kNone);
    REQUIRE(state.signals.empty());
}

TEST_CASE("Single insertion scores value * weight / normalizer", "[fusion][aggregator]")
{
    SECTION("coercion")
    {
        ConfidenceAggregator<CoercionTraits> agg;
        auto res = agg.addSignal(CoercionKind::kForcedUnlock, 45.0, "unlock", kT0, kT0);
        REQUIRE(res.has_value());
        REQUIRE(res->score == 34); // 45 * 1.5 / 2 = 33.75
        REQUIRE(res->level == CoercionLevel::kNone);
    }

    SECTION("danger")
    {
        ConfidenceAggregator<DangerTraits> agg;
        auto res = agg.addSignal(DangerKind::kVoice, 50.0, "scream", kT0, kT0);
        REQUIRE(res.has_value());
        REQUIRE(res->score == 15); // 50 * 30 / 100
        REQUIRE(res->level == DangerLevel::kSafe);
    }

    SECTION("situational")
    {
        ConfidenceAggregator<SituationalTraits> agg;
        auto res = agg.addSignal(SituationalKind::kLocation, 60.0, "off route", kT0, kT0);
        REQUIRE(res.has_value());
        REQUIRE(res->score == 30); // 60 * 1.5 / 3
        REQUIRE(res->level == SituationalLevel::kMonitoring);
    }
}

TEST_CASE("Score is capped at 100", "[fusion][aggregator]")
{
    ConfidenceAggregator<CoercionTraits> agg;
    for (int i = 0; i < 5; ++i)
        REQUIRE(agg.addSignal(CoercionKind::kForcedUnlock, 100.0, "", kT0, kT0).has_value());
    REQUIRE(agg.score(kT0) == 100);
}

TEST_CASE("Score never increases as time passes without insertions", "[fusion][aggregator]")
{
    ConfidenceAggregator<SituationalTraits> agg;
    REQUIRE(agg.addSignal(SituationalKind::kRoutine, 80.0, "", kT0, kT0).has_value());
    REQUIRE(agg.addSignal(SituationalKind::kHandling, 55.0, "", kT0 + 2min, kT0 + 2min).has_value());
    REQUIRE(agg.addSignal(SituationalKind::kNoise, 10.0, "", kT0 + 4min, kT0 + 4min).has_value());

    core::i32 previous = agg.score(kT0 + 4min);
    for (auto t = kT0 + 4min; t <= kT0 + 25min; t += 15s) {
        const core::i32 current = agg.score(t);
        REQUIRE(current <= previous);
        REQUIRE(current >= 0);
        previous = current;
    }
    REQUIRE(agg.score(kT0 + 20min) == 0);
}

TEST_CASE("Decay is linear over the half-life", "[fusion][aggregator]")
{
    using Agg = ConfidenceAggregator<CoercionTraits>;
    REQUIRE(Agg::decay(kT0, kT0) == 1.0);
    REQUIRE(std::abs(Agg::decay(kT0, kT0 + 150s) - 0.5) < 1e-9);
    REQUIRE(Agg::decay(kT0, kT0 + 5min) == 0.0);
    REQUIRE(Agg::decay(kT0, kT0 + 1h) == 0.0);
    // A signal stamped ahead of the evaluation instant counts as fresh.
    REQUIRE(Agg::decay(kT0 + 1min, kT0) == 1.0);
}

TEST_CASE("History evicts the oldest arrival at capacity", "[fusion][aggregator]")
{
    ConfidenceAggregator<DangerTraits> agg;
    for (int i = 0; i < 25; ++i)
        REQUIRE(agg.addSignal(DangerKind::kMotion, static_cast<double>(i), "", kT0, kT0).has_value());

    REQUIRE(agg.history().size() == DangerTraits::kCapacity);
    REQUIRE(agg.history().front().value == 5.0);
    REQUIRE(agg.history().back().value == 24.0);
}

TEST_CASE("Late signals are appended by arrival", "[fusion][aggregator]")
{
    ConfidenceAggregator<CoercionTraits> agg;
    REQUIRE(agg.addSignal(CoercionKind::kStressPattern, 10.0, "new", kT0 + 1min, kT0 + 1min).has_value());
    REQUIRE(agg.addSignal(CoercionKind::kStressPattern, 10.0, "old", kT0, kT0 + 1min).has_value());

    REQUIRE(agg.history().back().description == "old");
    // 10*1.4*1 + 10*1.4*0.8 = 25.2 -> 12.6 -> 13
    REQUIRE(agg.score(kT0 + 1min) == 13);
}

TEST_CASE("Duplicate simultaneous signals are both kept", "[fusion][aggregator]")
{
    ConfidenceAggregator<CoercionTraits> agg;
    REQUIRE(agg.addSignal(CoercionKind::kErraticTouch, 35.0, "", kT0, kT0).has_value());
    auto res = agg.addSignal(CoercionKind::kErraticTouch, 35.0, "", kT0, kT0);
    REQUIRE(res.has_value());
    REQUIRE(res->signals.size() == 2);
    REQUIRE(res->score == 42); // 2 * 35 * 1.2 / 2
    REQUIRE(res->level == CoercionLevel::kSuspected);
}

TEST_CASE("Invalid input leaves the history unchanged", "[fusion][aggregator]")
{
    ConfidenceAggregator<CoercionTraits> agg;

    SECTION("negative value")
    {
        auto res = agg.addSignal(CoercionKind::kShakingHands, -1.0, "", kT0, kT0);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("non-finite value")
    {
        auto res = agg.addSignal(CoercionKind::kShakingHands, std::numeric_limits<double>::quiet_NaN(), "", kT0, kT0);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code() == core::ErrorCode::kInvalidArgument);
    }

    SECTION("kind outside the table")
    {
        auto res = agg.addSignal(static_cast<CoercionKind>(42), 10.0, "", kT0, kT0);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code() == core::ErrorCode::kUnknownKind);
    }

    REQUIRE(agg.history().empty());
}

TEST_CASE("Kind names parse onto the closed enums", "[fusion][traits]")
{
    REQUIRE(parseCoercionKind("stress_pattern").value() == CoercionKind::kStressPattern);
    REQUIRE(parseDangerKind("inactivity").value() == DangerKind::kInactivity);
    REQUIRE(parseSituationalKind("stillness").value() == SituationalKind::kStillness);

    auto bad = parseCoercionKind("telepathy");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code() == core::ErrorCode::kUnknownKind);
}

TEST_CASE("Danger thresholds", "[fusion][traits]")
{
    REQUIRE(DangerTraits::levelFor(59) == DangerLevel::kSafe);
    REQUIRE(DangerTraits::levelFor(60) == DangerLevel::kUncertain);
    REQUIRE(DangerTraits::levelFor(80) == DangerLevel::kHigh);
    REQUIRE(DangerTraits::levelFor(81) == DangerLevel::kEmergency);
    REQUIRE(SituationalTraits::levelFor(75) == SituationalLevel::kCritical);
    REQUIRE(SituationalTraits::levelFor(50) == SituationalLevel::kArmed);
}
