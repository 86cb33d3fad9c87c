/**
 * @file Platform.hpp
 * @brief Compiler detection and branch-prediction hints.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-03-14
 * @copyright MIT License
 */
#pragma once

#ifndef RWN_CORE_PLATFORM_HPP
    #define RWN_CORE_PLATFORM_HPP

    #if defined(__clang__)
        #define RWN_COMPILER_CLANG 1
    #elif defined(__GNUC__)
        #define RWN_COMPILER_GCC   1
    #else
        #define RWN_COMPILER_UNKNOWN 1
    #endif

    #if defined(RWN_COMPILER_GCC) || defined(RWN_COMPILER_CLANG)
        #define RWN_LIKELY(x)       __builtin_expect(!!(x), 1)
        #define RWN_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define RWN_LIKELY(x)       (x)
        #define RWN_UNLIKELY(x)     (x)
    #endif

#endif // RWN_CORE_PLATFORM_HPP
