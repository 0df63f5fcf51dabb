/**
 * @file Platform.hpp
 * @brief Build-time feature switches and the few CPU/compiler hooks the
 *        engine relies on.
 *
 * RDX_MULTI_THREADED and RDX_PROFILING are normally set by the build
 * (RDX_ENABLE_THREADS, RDX_ENABLE_PROFILING); the defaults below apply to
 * consumers compiling the headers without it.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_CORE_PLATFORM_HPP
    #define RDX_CORE_PLATFORM_HPP

    #include <cstddef>

// ---- Feature Toggles -----------------------------------------------------

    // 0: any JobSystem handed to the engine is ignored and the same
    // algorithm runs on the calling thread.
    #ifndef RDX_MULTI_THREADED
        #define RDX_MULTI_THREADED 1
    #endif

    // 1: the engine feeds radix::Profile::global().
    #ifndef RDX_PROFILING
        #define RDX_PROFILING 0
    #endif

// ---- Branch Hint ---------------------------------------------------------

    #if defined(__GNUC__) || defined(__clang__)
        #define RDX_UNLIKELY(x)     __builtin_expect(!!(x), 0)
    #else
        #define RDX_UNLIKELY(x)     (x)
    #endif

// ---- CPU Pause Hint ------------------------------------------------------

    #if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
        #include <immintrin.h>
        #define RDX_CPU_PAUSE() _mm_pause()
    #elif defined(__aarch64__) || defined(_M_ARM64)
        #define RDX_CPU_PAUSE() __asm__ volatile("yield")
    #else
        #define RDX_CPU_PAUSE() ((void)0)
    #endif

namespace rdx::core {

/// Worker deques are padded to this size so that two workers never share
/// a line.
inline constexpr std::size_t kCacheLineSize = 64;

} // namespace rdx::core

#endif // RDX_CORE_PLATFORM_HPP
