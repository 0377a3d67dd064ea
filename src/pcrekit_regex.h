// PCREKit - Regex Handle and Builder
// Copyright (c) 2026 greenteng.com
//
// Regex is an immutable compiled pattern that can be shared by reference
// between threads. Each thread searching it gets its own scratch from the
// regex's ScratchCache; copies of a Regex share the compiled code but keep
// separate caches.

#ifndef PCREKIT_REGEX_H
#define PCREKIT_REGEX_H

#include "pcrekit_config.h"
#include "pcrekit_engine.h"
#include "pcrekit_error.h"
#include "pcrekit_iter.h"
#include "pcrekit_match.h"
#include "pcrekit_scratch.h"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pcrekit {

class Regex;

using CaptureNames = std::vector<std::optional<std::string>>;

// ============================================================================
// RegexBuilder
// ============================================================================

class RegexBuilder {
public:
    RegexBuilder() = default;

    // Compile `pattern` with the current configuration.
    // Throws CompileError.
    Regex build(std::string_view pattern) const;

    // Case insensitive matching (the `i` flag). Unicode case folding is used
    // in UTF mode, ASCII case folding otherwise.
    RegexBuilder& caseless(bool yes);

    // `.` also matches `\n` (the `s` flag)
    RegexBuilder& dotall(bool yes);

    // Ignore whitespace and `#` comments in the pattern (the `x` flag)
    RegexBuilder& extended(bool yes);

    // `^` and `$` also match at line boundaries (the `m` flag)
    RegexBuilder& multiLine(bool yes);

    // Recognize `\r`, `\n` and `\r\n` as line terminators
    RegexBuilder& crlf(bool yes);

    // Unicode aware `\b`, `\d`, `\s`, `\w` and friends. Implies utf.
    RegexBuilder& ucp(bool yes);

    // Treat pattern and subject as UTF-8 rather than bytes. Every search
    // then validates the subject unless unsafeDisableUtfCheck is used.
    RegexBuilder& utf(bool yes);

    // Stop the pattern from switching itself to UTF mode with (*UTF)
    RegexBuilder& neverUtf(bool yes);

    // Skip the UTF-8 validation PCRE2 performs on every search in UTF mode.
    // Has no effect when UTF mode is off.
    //
    // UNSAFE: with this set, every subject searched in UTF mode must be
    // valid UTF-8. Searching invalid UTF-8 is undefined behavior inside
    // the engine, and nothing in this library will catch it.
    RegexBuilder& unsafeDisableUtfCheck();

    // JIT compile the pattern and fail the build if that is not possible.
    // Passing false turns JIT off. Overrides jitIfAvailable.
    RegexBuilder& jit(bool yes);

    // JIT compile the pattern if possible, silently falling back to the
    // interpreter otherwise. Passing false turns JIT off. Overrides jit.
    RegexBuilder& jitIfAvailable(bool yes);

    // Maximum JIT stack size in bytes for every search, or nullopt for the
    // engine's default 32 KiB stack. No effect without JIT.
    // Throws std::invalid_argument for a size of 0.
    RegexBuilder& maxJitStackSize(std::optional<size_t> bytes);

private:
    Config config;
};

// ============================================================================
// Regex
// ============================================================================

class Regex {
public:
    // Compile `pattern` with the default configuration. Throws CompileError.
    explicit Regex(std::string_view pattern);

    Regex(const Regex& other);
    Regex& operator=(const Regex& other);
    Regex(Regex&&) noexcept = default;
    Regex& operator=(Regex&&) noexcept = default;

    // ------------------------------------------------------------------------
    // Searching
    //
    // All searches throw MatchError on engine failures. The *At variants
    // throw std::out_of_range if start > subject.size(). Starting later
    // keeps the surrounding context: `\A` only matches when start == 0.
    // ------------------------------------------------------------------------

    bool isMatch(std::string_view subject) const;
    bool isMatchAt(std::string_view subject, size_t start) const;

    // Leftmost-first match
    std::optional<Match> find(std::string_view subject) const;
    std::optional<Match> findAt(std::string_view subject, size_t start) const;

    // Every non-overlapping match, in order
    Matches findIter(std::string_view subject) const;

    std::optional<Captures> captures(std::string_view subject) const;
    CaptureMatches capturesIter(std::string_view subject) const;

    // Like captures, but fills caller-owned locations so the allocation can
    // be reused. Returns the overall match. Throws std::invalid_argument if
    // `locs` was not created by this regex (or a copy of it).
    std::optional<Match> capturesRead(CaptureLocations& locs, std::string_view subject) const;
    std::optional<Match> capturesReadAt(CaptureLocations& locs, std::string_view subject, size_t start) const;

    // ------------------------------------------------------------------------
    // Introspection
    // ------------------------------------------------------------------------

    // The pattern as given to the builder
    const std::string& asStr() const { return pattern; }

    // Name of every group, capturesLen() entries, group 0 unnamed
    const CaptureNames& captureNames() const { return *names; }

    // Number of groups including group 0
    size_t capturesLen() const;

    // Fresh locations for capturesRead / capturesReadAt
    CaptureLocations captureLocations() const;

    // Scratches created by this regex's per-thread cache
    size_t scratchCount() const { return cache->created(); }

    bool isJitCompiled() const { return code->isJitCompiled(); }

private:
    friend class RegexBuilder;
    friend class CaptureMatches;

    Regex(std::shared_ptr<const Config> config,
          std::string pattern,
          std::shared_ptr<const Code> code,
          std::shared_ptr<const CaptureNames> names,
          std::shared_ptr<const NameIndex> nameIndex);

    std::shared_ptr<const Config> config;
    std::string pattern;
    std::shared_ptr<const Code> code;
    std::shared_ptr<const CaptureNames> names;
    std::shared_ptr<const NameIndex> nameIndex;
    std::unique_ptr<ScratchCache> cache;

    uint32_t matchOptions() const;
    std::optional<Match> findWith(MatchData& scratch, std::string_view subject, size_t start) const;
};

std::ostream& operator<<(std::ostream& os, const Regex& re);

// ============================================================================
// Utility Functions
// ============================================================================

// Backslash-escape every regex metacharacter in `text` so the result
// matches `text` literally. Whitespace and `#` are left alone, so this does
// not hold for a regex built with extended(true).
std::string escape(std::string_view text);

// Library version followed by the linked PCRE2 version
std::string version();

} // namespace pcrekit

#endif // PCREKIT_REGEX_H
