/**
 * @file Platform.hpp
 * @brief Compiler portability macros.
 *
 * Provides the branch-prediction hint used by the assertion macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef ASTRO_CORE_PLATFORM_HPP
    #define ASTRO_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define ASTRO_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define ASTRO_UNLIKELY(x)     (x)
    #endif

#endif // ASTRO_CORE_PLATFORM_HPP
