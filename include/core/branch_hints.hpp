// branch_hints.hpp
// Branch Prediction Hints for the Crypto Backtesting Engine
// Compiler-specific hints used on the per-event hot path

#pragma once

// ============================================================================
// Branch Prediction Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define CRYPTOBT_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define CRYPTOBT_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define CRYPTOBT_LIKELY(x)   (x)
    #define CRYPTOBT_UNLIKELY(x) (x)
#endif

// Hot/cold function attributes
#if defined(__GNUC__) || defined(__clang__)
    #define CRYPTOBT_HOT_FUNCTION  __attribute__((hot))
    #define CRYPTOBT_COLD_FUNCTION __attribute__((cold))
#else
    #define CRYPTOBT_HOT_FUNCTION
    #define CRYPTOBT_COLD_FUNCTION
#endif
