// /////////////////////////////////////////////////////////////////////////////
/// @file Config.hpp
/// @brief Replay configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder.
/// Centralises the pacing and shortcut parameters of the controller.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <rwd/core/Types.hpp>
#include <rwd/core/Constants.hpp>

#include <string>

namespace rwd::engine {

/// @brief Immutable controller configuration.
class Config
{
public:
    /// @brief Fluent builder for Config.
    class Builder
    {
    public:
        Builder& stepsPerSecond(core::f64 rate) noexcept;
        Builder& tickIntervalMs(core::f64 ms) noexcept;
        Builder& playOnShortcutRun(bool enabled) noexcept;
        Builder& contextId(std::string id);

        [[nodiscard]] Config build() const;

    private:
        core::f64 stepsPerSecond_{core::kDefaultStepsPerSecond};
        core::f64 tickIntervalMs_{core::kDefaultTickIntervalMs};
        bool playOnShortcutRun_{true};
        std::string contextId_;
    };

    /// @brief Replay speed during continuous play.
    [[nodiscard]] core::f64 stepsPerSecond()  const noexcept { return stepsPerSecond_; }
    /// @brief Host clock polling interval.
    [[nodiscard]] core::f64 tickIntervalMs()  const noexcept { return tickIntervalMs_; }
    /// @brief Whether the run shortcut also starts playback.
    [[nodiscard]] bool playOnShortcutRun()    const noexcept { return playOnShortcutRun_; }
    /// @brief Level or example identifier handed to the interpreter.
    [[nodiscard]] const std::string& contextId() const noexcept { return contextId_; }

    [[nodiscard]] core::f64 msPerStep() const noexcept { return core::kMsPerSecond / stepsPerSecond_; }

private:
    friend class Builder;

    core::f64 stepsPerSecond_{core::kDefaultStepsPerSecond};
    core::f64 tickIntervalMs_{core::kDefaultTickIntervalMs};
    bool playOnShortcutRun_{true};
    std::string contextId_;
};

} // namespace rwd::engine
