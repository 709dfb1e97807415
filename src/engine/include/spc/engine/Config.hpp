// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Safety engine configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Only operational choices live here; the safety thresholds themselves
/// are compile-time constants.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <spc/core/Constants.hpp>
#include <spc/core/Log.hpp>
#include <spc/core/Types.hpp>

namespace spc::engine {

/// @brief Immutable engine configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& defaultAutoReleaseHours(core::u32 hours) noexcept;
        Builder& sampleRate(core::u32 hz) noexcept;
        Builder& autonomousMode(bool enabled) noexcept;
        Builder& autoLockOnIntent(bool enabled) noexcept;
        Builder& alertWorker(bool enabled) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;

        [[nodiscard]] Config build() const noexcept;

    private:
        core::u32      defaultAutoReleaseHours_{core::kDefaultAutoReleaseHours};
        core::u32      sampleRate_{core::kDefaultSampleRate};
        bool           autonomousMode_{false};
        bool           autoLockOnIntent_{false};
        bool           alertWorker_{true};
        core::LogLevel logLevel_{core::LogLevel::kInfo};
    };

    [[nodiscard]] core::u32      defaultAutoReleaseHours() const noexcept { return defaultAutoReleaseHours_; }
    [[nodiscard]] core::u32      sampleRate()              const noexcept { return sampleRate_; }
    [[nodiscard]] bool           autonomousMode()          const noexcept { return autonomousMode_; }
    [[nodiscard]] bool           autoLockOnIntent()        const noexcept { return autoLockOnIntent_; }
    [[nodiscard]] bool           alertWorker()             const noexcept { return alertWorker_; }
    [[nodiscard]] core::LogLevel logLevel()                const noexcept { return logLevel_; }

private:
    friend class Builder;

    core::u32      defaultAutoReleaseHours_{core::kDefaultAutoReleaseHours};
    core::u32      sampleRate_{core::kDefaultSampleRate};
    bool           autonomousMode_{false};
    bool           autoLockOnIntent_{false};
    bool           alertWorker_{true};
    core::LogLevel logLevel_{core::LogLevel::kInfo};
};

} // namespace spc::engine
