// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <spc/engine/Config.hpp>

namespace spc::engine {

Config::Builder& Config::Builder::defaultAutoReleaseHours(core::u32 hours) noexcept
{
    defaultAutoReleaseHours_ = hours;
    return *this;
}

Config::Builder& Config::Builder::sampleRate(core::u32 hz) noexcept
{
    sampleRate_ = hz;
    return *this;
}

Config::Builder& Config::Builder::autonomousMode(bool enabled) noexcept
{
    autonomousMode_ = enabled;
    return *this;
}

Config::Builder& Config::Builder::autoLockOnIntent(bool enabled) noexcept
{
    autoLockOnIntent_ = enabled;
    return *this;
}

Config::Builder& Config::Builder::alertWorker(bool enabled) noexcept
{
    alertWorker_ = enabled;
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    logLevel_ = level;
    return *this;
}

Config Config::Builder::build() const noexcept
{
    Config cfg;
    cfg.defaultAutoReleaseHours_ = defaultAutoReleaseHours_;
    cfg.sampleRate_              = sampleRate_;
    cfg.autonomousMode_          = autonomousMode_;
    cfg.autoLockOnIntent_        = autoLockOnIntent_;
    cfg.alertWorker_             = alertWorker_;
    cfg.logLevel_                = logLevel_;
    return cfg;
}

} // namespace spc::engine
