/**
 * @file Constants.hpp
 * @brief Replay-wide compile-time defaults and limits.
 *
 * Defaults and bounds consumed by engine::Config::Builder. A host overrides them at
 * runtime through the builder; nothing reads these directly at playback time.
 */
#pragma once

#ifndef RWD_CORE_CONSTANTS_HPP
    #define RWD_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace rwd::core {

inline constexpr f64   kDefaultStepsPerSecond = 1.0;
inline constexpr f64   kDefaultTickIntervalMs = 16.0;
inline constexpr f64   kMaxStepsPerSecond     = 1000.0;
inline constexpr f64   kMsPerSecond           = 1000.0;

} // namespace rwd::core

#endif // RWD_CORE_CONSTANTS_HPP
