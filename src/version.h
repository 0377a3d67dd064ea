// Version information for the pcrekit library
// Copyright (c) 2026 greenteng.com

#ifndef PCREKIT_VERSION_H
#define PCREKIT_VERSION_H

// ============================================================================
// VERSION
// ============================================================================

#define PCREKIT_VERSION_MAJOR  0
#define PCREKIT_VERSION_MINOR  3
#define PCREKIT_VERSION_PATCH  1

// ============================================================================
// DERIVED VERSION MACROS - DO NOT MODIFY
// ============================================================================

#define PCREKIT_STRINGIFY2(x) #x
#define PCREKIT_STRINGIFY(x) PCREKIT_STRINGIFY2(x)

#define PCREKIT_VERSION_STRING \
    PCREKIT_STRINGIFY(PCREKIT_VERSION_MAJOR) "." \
    PCREKIT_STRINGIFY(PCREKIT_VERSION_MINOR) "." \
    PCREKIT_STRINGIFY(PCREKIT_VERSION_PATCH)

#endif // PCREKIT_VERSION_H
