/**
 * @file DomainTraits.hpp
 * @brief Closed signal-kind enums and fixed scoring tables per domain.
 *
 * Each domain (overt danger, coercion, situational pre-danger) is
 * described by a traits struct: its signal kinds and their weights, its
 * ordered escalation levels and their thresholds, the decay half-life,
 * the score normalizer and the history capacity.  The generic
 * ConfidenceAggregator is instantiated once per traits struct.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef SPC_FUSION_DOMAIN_TRAITS_HPP
    #define SPC_FUSION_DOMAIN_TRAITS_HPP

    #include <spc/alert/Alert.hpp>
    #include <spc/core/Concepts.hpp>
    #include <spc/core/Expected.hpp>
    #include <spc/core/Types.hpp>

    #include <array>
    #include <concepts>
    #include <string_view>

namespace spc::fusion {

/**
 * @brief Requirements on a domain traits struct.
 */
template <typename T>
concept DomainTraits = requires(typename T::Kind kind, typename T::Level level, core::i32 score) {
    requires core::ScopedEnum<typename T::Kind>;
    requires core::ScopedEnum<typename T::Level>;
    { T::kCapacity }        -> std::convertible_to<core::usize>;
    { T::kHalfLifeMinutes } -> std::convertible_to<double>;
    { T::kNormalizer }      -> std::convertible_to<double>;
    { T::kLowest }          -> std::convertible_to<typename T::Level>;
    { T::kHighest }         -> std::convertible_to<typename T::Level>;
    { T::kDomain }          -> std::convertible_to<alert::Domain>;
    { T::kKindCount }       -> std::convertible_to<core::usize>;
    { T::weight(kind) }     -> std::same_as<double>;
    { T::levelFor(score) }  -> std::same_as<typename T::Level>;
    { T::kindName(kind) }   -> std::same_as<std::string_view>;
    { T::levelName(level) } -> std::same_as<std::string_view>;
};

// ============================================================================
// Danger
// ============================================================================

enum class DangerKind : core::u8 {
    kMotion = 0,
    kVoice,
    kInactivity,
    kLocation,
    kTime,
    kPattern,
};

enum class DangerLevel : core::u8 {
    kSafe = 0,
    kUncertain,
    kHigh,
    kEmergency,
};

struct DangerTraits {
    using Kind  = DangerKind;
    using Level = DangerLevel;

    static constexpr core::usize   kCapacity       = 20;
    static constexpr double        kHalfLifeMinutes = 10.0;
    static constexpr double        kNormalizer     = 100.0;
    static constexpr Level         kLowest         = Level::kSafe;
    static constexpr Level         kHighest        = Level::kEmergency;
    static constexpr alert::Domain kDomain         = alert::Domain::kDanger;
    static constexpr core::usize   kKindCount      = 6;

    static constexpr std::array<double, kKindCount> kWeights = {25.0, 30.0, 20.0, 15.0, 10.0, 20.0};

    [[nodiscard]] static constexpr double weight(Kind kind) noexcept
    {
        return kWeights[static_cast<core::usize>(kind)];
    }

    // "high" covers exactly one score value; kept as observed in the field.
    [[nodiscard]] static constexpr Level levelFor(core::i32 score) noexcept
    {
        if (score >= 81) return Level::kEmergency;
        if (score >= 80) return Level::kHigh;
        if (score >= 60) return Level::kUncertain;
        return Level::kSafe;
    }

    [[nodiscard]] static constexpr std::string_view kindName(Kind kind) noexcept
    {
        switch (kind) {
            case Kind::kMotion:     return "motion";
            case Kind::kVoice:      return "voice";
            case Kind::kInactivity: return "inactivity";
            case Kind::kLocation:   return "location";
            case Kind::kTime:       return "time";
            case Kind::kPattern:    return "pattern";
        }
        return "unknown";
    }

    [[nodiscard]] static constexpr std::string_view levelName(Level level) noexcept
    {
        switch (level) {
            case Level::kSafe:      return "safe";
            case Level::kUncertain: return "uncertain";
            case Level::kHigh:      return "high";
            case Level::kEmergency: return "emergency";
        }
        return "unknown";
    }
};

// ============================================================================
// Coercion
// ============================================================================

enum class CoercionKind : core::u8 {
    kForcedUnlock = 0,
    kShakingHands,
    kErraticTouch,
    kRapidNavigation,
    kUnusualTiming,
    kStressPattern,
};

enum class CoercionLevel : core::u8 {
    kNone = 0,
    kSuspected,
    kConfirmed,
};

struct CoercionTraits {
    using Kind  = CoercionKind;
    using Level = CoercionLevel;

    static constexpr core::usize   kCapacity       = 30;
    static constexpr double        kHalfLifeMinutes = 5.0;
    static constexpr double        kNormalizer     = 2.0;
    static constexpr Level         kLowest         = Level::kNone;
    static constexpr Level         kHighest        = Level::kConfirmed;
    static constexpr alert::Domain kDomain         = alert::Domain::kCoercion;
    static constexpr core::usize   kKindCount      = 6;

    static constexpr std::array<double, kKindCount> kWeights = {1.5, 1.3, 1.2, 1.0, 0.8, 1.4};

    [[nodiscard]] static constexpr double weight(Kind kind) noexcept
    {
        return kWeights[static_cast<core::usize>(kind)];
    }

    [[nodiscard]] static constexpr Level levelFor(core::i32 score) noexcept
    {
        if (score >= 70) return Level::kConfirmed;
        if (score >= 40) return Level::kSuspected;
        return Level::kNone;
    }

    [[nodiscard]] static constexpr std::string_view kindName(Kind kind) noexcept
    {
        switch (kind) {
            case Kind::kForcedUnlock:    return "forced_unlock";
            case Kind::kShakingHands:    return "shaking_hands";
            case Kind::kErraticTouch:    return "erratic_touch";
            case Kind::kRapidNavigation: return "rapid_navigation";
            case Kind::kUnusualTiming:   return "unusual_timing";
            case Kind::kStressPattern:   return "stress_pattern";
        }
        return "unknown";
    }

    [[nodiscard]] static constexpr std::string_view levelName(Level level) noexcept
    {
        switch (level) {
            case Level::kNone:      return "none";
            case Level::kSuspected: return "suspected";
            case Level::kConfirmed: return "confirmed";
        }
        return "unknown";
    }
};

// ============================================================================
// Situational (pre-danger)
// ============================================================================

enum class SituationalKind : core::u8 {
    kMotion = 0,
    kLocation,
    kTime,
    kHandling,
    kNoise,
    kRoutine,
    kStillness,
};

enum class SituationalLevel : core::u8 {
    kNone = 0,
    kMonitoring,
    kArmed,
    kCritical,
};

struct SituationalTraits {
    using Kind  = SituationalKind;
    using Level = SituationalLevel;

    static constexpr core::usize   kCapacity       = 50;
    static constexpr double        kHalfLifeMinutes = 15.0;
    static constexpr double        kNormalizer     = 3.0;
    static constexpr Level         kLowest         = Level::kNone;
    static constexpr Level         kHighest        = Level::kCritical;
    static constexpr alert::Domain kDomain         = alert::Domain::kSituational;
    static constexpr core::usize   kKindCount      = 7;

    static constexpr std::array<double, kKindCount> kWeights = {1.2, 1.5, 0.8, 1.3, 0.9, 1.4, 1.1};

    [[nodiscard]] static constexpr double weight(Kind kind) noexcept
    {
        return kWeights[static_cast<core::usize>(kind)];
    }

    [[nodiscard]] static constexpr Level levelFor(core::i32 score) noexcept
    {
        if (score >= 75) return Level::kCritical;
        if (score >= 50) return Level::kArmed;
        if (score >= 30) return Level::kMonitoring;
        return Level::kNone;
    }

    [[nodiscard]] static constexpr std::string_view kindName(Kind kind) noexcept
    {
        switch (kind) {
            case Kind::kMotion:    return "motion";
            case Kind::kLocation:  return "location";
            case Kind::kTime:      return "time";
            case Kind::kHandling:  return "handling";
            case Kind::kNoise:     return "noise";
            case Kind::kRoutine:   return "routine";
            case Kind::kStillness: return "stillness";
        }
        return "unknown";
    }

    [[nodiscard]] static constexpr std::string_view levelName(Level level) noexcept
    {
        switch (level) {
            case Level::kNone:       return "none";
            case Level::kMonitoring: return "monitoring";
            case Level::kArmed:      return "armed";
            case Level::kCritical:   return "critical";
        }
        return "unknown";
    }
};

static_assert(DomainTraits<DangerTraits>);
static_assert(DomainTraits<CoercionTraits>);
static_assert(DomainTraits<SituationalTraits>);

/**
 * @brief True when @p kind is one of the enumerators of its domain.
 */
template <DomainTraits Traits>
[[nodiscard]] constexpr bool isKnownKind(typename Traits::Kind kind) noexcept
{
    return static_cast<core::usize>(kind) < Traits::kKindCount;
}

/**
 * @brief Map a capture-collaborator kind name onto the closed enum.
 * @return The kind, or @c kUnknownKind when @p name is not recognised.
 */
template <DomainTraits Traits>
[[nodiscard]] core::Expected<typename Traits::Kind> parseKind(std::string_view name)
{
    for (core::usize i = 0; i < Traits::kKindCount; ++i) {
        const auto kind = static_cast<typename Traits::Kind>(i);
        if (Traits::kindName(kind) == name)
            return kind;
    }
    return core::makeError(core::ErrorCode::kUnknownKind, std::string{"unknown signal kind '"} + std::string{name} + "'");
}

[[nodiscard]] inline core::Expected<DangerKind> parseDangerKind(std::string_view name)
{
    return parseKind<DangerTraits>(name);
}

[[nodiscard]] inline core::Expected<CoercionKind> parseCoercionKind(std::string_view name)
{
    return parseKind<CoercionTraits>(name);
}

[[nodiscard]] inline core::Expected<SituationalKind> parseSituationalKind(std::string_view name)
{
    return parseKind<SituationalTraits>(name);
}

} // namespace spc::fusion

#endif // SPC_FUSION_DOMAIN_TRAITS_HPP
