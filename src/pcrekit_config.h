// PCREKit - Compile Configuration
// Copyright (c) 2026 greenteng.com
//
// Plain configuration values consumed by RegexBuilder. Translation into
// PCRE2 option bits happens in RegexBuilder::build.

#ifndef PCREKIT_CONFIG_H
#define PCREKIT_CONFIG_H

#include <stddef.h>
#include <optional>

namespace pcrekit {

// When and how pcre2_jit_compile is applied after compilation
enum class JitChoice {
    Never,      // never JIT compile
    Always,     // JIT compile and fail the build if that fails
    Attempt     // JIT compile, fall back to the interpreter on failure
};

// Match-time knobs, copied into every scratch created for a regex
struct MatchConfig {
    // Maximum JIT stack size in bytes. Unset means the engine's default
    // 32 KiB stack is used.
    std::optional<size_t> maxJitStackSize;
};

struct Config {
    bool caseless = false;      // PCRE2_CASELESS
    bool dotall = false;        // PCRE2_DOTALL
    bool extended = false;      // PCRE2_EXTENDED
    bool multiLine = false;     // PCRE2_MULTILINE
    bool crlf = false;          // PCRE2_NEWLINE_ANYCRLF
    bool ucp = false;           // PCRE2_UCP (implies utf)
    bool utf = false;           // PCRE2_UTF
    bool neverUtf = false;      // PCRE2_NEVER_UTF
    bool utfCheck = true;       // cleared => PCRE2_NO_UTF_CHECK on every match
    JitChoice jit = JitChoice::Never;
    MatchConfig matchConfig;
};

} // namespace pcrekit

#endif // PCREKIT_CONFIG_H
