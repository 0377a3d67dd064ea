// PCREKit - Platform Detection Header
// Copyright (c) 2026 greenteng.com
//
// Compiler and debug macros shared by all pcrekit modules

#ifndef PCREKIT_PLATFORM_H
#define PCREKIT_PLATFORM_H

// ============================================================================
// Compiler-specific
// ============================================================================

#if defined(_MSC_VER)
    #define PCREKIT_FORCE_INLINE __forceinline
#elif defined(__GNUC__) || defined(__clang__)
    #define PCREKIT_FORCE_INLINE __attribute__((always_inline)) inline
#else
    #define PCREKIT_FORCE_INLINE inline
#endif

// ============================================================================
// Debug macros
// ============================================================================

#ifdef NDEBUG
    #define PCREKIT_DEBUG 0
#else
    #define PCREKIT_DEBUG 1
#endif

#if PCREKIT_DEBUG
    #include <stdio.h>
    #define PCREKIT_LOG(fmt, ...) fprintf(stderr, "[PCREKIT] " fmt "\n", ##__VA_ARGS__)
#else
    #define PCREKIT_LOG(fmt, ...) ((void)0)
#endif

#endif // PCREKIT_PLATFORM_H
