/**
 * @file Platform.hpp
 * @brief Branch-prediction hints.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RWD_CORE_PLATFORM_HPP
    #define RWD_CORE_PLATFORM_HPP

// ---- Intrinsics ----------------------------------------------------------

    #if defined(__GNUC__) || defined(__clang__)
        #define RWD_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define RWD_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define RWD_LIKELY(x)       (x)
        #define RWD_UNLIKELY(x)     (x)
    #endif

#endif // RWD_CORE_PLATFORM_HPP
