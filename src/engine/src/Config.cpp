// /////////////////////////////////////////////////////////////////////////////
/// @file Config.cpp
/// @brief Config::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <rwd/engine/Config.hpp>
#include <rwd/core/Log.hpp>

#include <cmath>

namespace rwd::engine {

Config::Builder& Config::Builder::stepsPerSecond(core::f64 rate) noexcept
{
    if (std::isfinite(rate) && rate > 0.0 && rate <= core::kMaxStepsPerSecond)
        stepsPerSecond_ = rate;
    else
        core::Log::warn("engine", "ignoring non-finite or out-of-range steps-per-second rate");
    return *this;
}

Config::Builder& Config::Builder::tickIntervalMs(core::f64 ms) noexcept
{
    if (std::isfinite(ms) && ms > 0.0)
        tickIntervalMs_ = ms;
    else
        core::Log::warn("engine", "ignoring non-finite or non-positive tick interval");
    return *this;
}

Config::Builder& Config::Builder::playOnShortcutRun(bool enabled) noexcept
{
    playOnShortcutRun_ = enabled;
    return *this;
}

Config::Builder& Config::Builder::contextId(std::string id)
{
    contextId_ = std::move(id);
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg.stepsPerSecond_    = stepsPerSecond_;
    cfg.tickIntervalMs_    = tickIntervalMs_;
    cfg.playOnShortcutRun_ = playOnShortcutRun_;
    cfg.contextId_         = contextId_;
    return cfg;
}

} // namespace rwd::engine
