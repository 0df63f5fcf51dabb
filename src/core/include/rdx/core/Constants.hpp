/**
 * @file Constants.hpp
 * @brief Library-wide compile-time constants.
 *
 * The radix geometry and the default values of every tunable threshold
 * live here so that a single header controls the engine's fundamental
 * operating parameters.  The defaults are starting points, not measured
 * optima; override them per call with a radix::TuningTable (rdx_benchmark
 * accepts a tuning file to compare settings) rather than editing this
 * file.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef RDX_CORE_CONSTANTS_HPP
    #define RDX_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace rdx::core {

inline constexpr u32   kDigitBits                     = 8;
inline constexpr usize kRadix                         = usize{1} << kDigitBits;

inline constexpr usize kSmallSortThreshold            = 64;
inline constexpr usize kCountingSortThreshold         = 8'192;
inline constexpr usize kCountingSortMaxDigits         = 3;
inline constexpr usize kMaxCountingSortThreshold      = usize{1} << 22;

inline constexpr usize kParallelSplitThreshold        = 32'768;
inline constexpr usize kParallelCountThreshold        = usize{1} << 19;
inline constexpr usize kParallelCountChunksPerWorker  = 4;
inline constexpr usize kTaskBudgetPerWorker           = 16;
inline constexpr usize kMaxParallelDepth              = 3;

} // namespace rdx::core

#endif // RDX_CORE_CONSTANTS_HPP
