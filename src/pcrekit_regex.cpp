// PCREKit - Regex Handle Implementation
// Copyright (c) 2026 greenteng.com

#include "pcrekit_regex.h"
#include "pcrekit_platform.h"
#include "version.h"

#include <cstring>
#include <stdexcept>

namespace pcrekit {

// ============================================================================
// Helpers
// ============================================================================

// A start beyond the subject has no meaning, so it is a caller bug rather
// than a "no match" result
static PCREKIT_FORCE_INLINE void checkStart(std::string_view subject, size_t start) {
    if (start > subject.size()) {
        throw std::out_of_range("start (" + std::to_string(start) +
                                ") must be <= subject length (" +
                                std::to_string(subject.size()) + ")");
    }
}

// ============================================================================
// Construction
// ============================================================================

Regex::Regex(std::string_view pattern) : Regex(RegexBuilder().build(pattern)) {}

Regex::Regex(std::shared_ptr<const Config> cfg,
             std::string pat,
             std::shared_ptr<const Code> c,
             std::shared_ptr<const CaptureNames> n,
             std::shared_ptr<const NameIndex> idx)
    : config(std::move(cfg)),
      pattern(std::move(pat)),
      code(std::move(c)),
      names(std::move(n)),
      nameIndex(std::move(idx)),
      cache(std::make_unique<ScratchCache>(code, config->matchConfig)) {}

Regex::Regex(const Regex& other)
    : config(other.config),
      pattern(other.pattern),
      code(other.code),
      names(other.names),
      nameIndex(other.nameIndex),
      cache(std::make_unique<ScratchCache>(code, config->matchConfig)) {}

Regex& Regex::operator=(const Regex& other) {
    if (this != &other) {
        Regex copy(other);
        *this = std::move(copy);
    }
    return *this;
}

// ============================================================================
// Search Session
// ============================================================================

uint32_t Regex::matchOptions() const {
    uint32_t options = 0;
    if (!config->utfCheck) {
        // The caller accepted the UTF-8 precondition through
        // RegexBuilder::unsafeDisableUtfCheck
        options |= PCRE2_NO_UTF_CHECK;
    }
    return options;
}

std::optional<Match> Regex::findWith(MatchData& scratch, std::string_view subject, size_t start) const {
    checkStart(subject, start);
    if (!scratch.find(*code, subject, start, matchOptions())) {
        return std::nullopt;
    }
    const PCRE2_SIZE* ovector = scratch.ovector();
    return Match(subject, ovector[0], ovector[1]);
}

bool Regex::isMatch(std::string_view subject) const {
    return isMatchAt(subject, 0);
}

bool Regex::isMatchAt(std::string_view subject, size_t start) const {
    checkStart(subject, start);
    return cache->get().find(*code, subject, start, matchOptions());
}

std::optional<Match> Regex::find(std::string_view subject) const {
    return findAt(subject, 0);
}

std::optional<Match> Regex::findAt(std::string_view subject, size_t start) const {
    return findWith(cache->get(), subject, start);
}

Matches Regex::findIter(std::string_view subject) const {
    return Matches(*this, subject);
}

// ============================================================================
// Captures
// ============================================================================

std::optional<Captures> Regex::captures(std::string_view subject) const {
    CaptureLocations locs = captureLocations();
    if (!capturesRead(locs, subject)) {
        return std::nullopt;
    }
    return Captures(subject, std::move(locs), nameIndex);
}

CaptureMatches Regex::capturesIter(std::string_view subject) const {
    return CaptureMatches(*this, subject);
}

std::optional<Match> Regex::capturesRead(CaptureLocations& locs, std::string_view subject) const {
    return capturesReadAt(locs, subject, 0);
}

std::optional<Match> Regex::capturesReadAt(CaptureLocations& locs, std::string_view subject, size_t start) const {
    if (locs.code != code) {
        throw std::invalid_argument("capture locations were created for a different regex");
    }
    return findWith(locs.data, subject, start);
}

// ============================================================================
// Introspection
// ============================================================================

size_t Regex::capturesLen() const {
    return code->captureCount();
}

CaptureLocations Regex::captureLocations() const {
    return CaptureLocations(code, MatchData(config->matchConfig, *code));
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string escape(std::string_view text) {
    static const char* special = "\\^$.|?*+()[]{}";

    std::string result;
    result.reserve(text.size() * 2);
    for (char c : text) {
        if (c != '\0' && strchr(special, c)) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::string version() {
    return std::string(PCREKIT_VERSION_STRING) + " (PCRE2 " +
           PCREKIT_STRINGIFY(PCRE2_MAJOR) "." PCREKIT_STRINGIFY(PCRE2_MINOR) ")";
}

} // namespace pcrekit
