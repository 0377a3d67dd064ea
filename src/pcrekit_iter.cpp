// PCREKit - Match Iteration Implementation
// Copyright (c) 2026 greenteng.com

#include "pcrekit_iter.h"
#include "pcrekit_regex.h"

namespace pcrekit {

// ============================================================================
// MatchCursor
// ============================================================================

bool MatchCursor::advance(size_t start, size_t end) {
    if (start == end) {
        // Empty match: the next one cannot start before end + 1
        lastEnd = end + 1;
        // Glued to the end of the previous match, skip it
        if (lastMatch && *lastMatch == end) {
            return false;
        }
    } else {
        lastEnd = end;
    }
    lastMatch = end;
    return true;
}

// ============================================================================
// Matches
// ============================================================================

Matches::Matches(const Regex& r, std::string_view s) : re(&r), subject(s) {}

std::optional<Match> Matches::next() {
    while (!cursor.exhausted(subject.size())) {
        // Stays stopped if the search throws or finds nothing
        cursor.stop();
        std::optional<Match> m = re->findAt(subject, cursor.position());
        if (!m) {
            return std::nullopt;
        }
        cursor.resume();
        if (cursor.advance(m->start(), m->end())) {
            return m;
        }
    }
    return std::nullopt;
}

// ============================================================================
// CaptureMatches
// ============================================================================

CaptureMatches::CaptureMatches(const Regex& r, std::string_view s) : re(&r), subject(s) {}

std::optional<Captures> CaptureMatches::next() {
    if (cursor.exhausted(subject.size())) {
        return std::nullopt;
    }
    // Reused across skipped empty matches, handed to the result otherwise
    CaptureLocations locs = re->captureLocations();
    while (!cursor.exhausted(subject.size())) {
        cursor.stop();
        std::optional<Match> m = re->capturesReadAt(locs, subject, cursor.position());
        if (!m) {
            return std::nullopt;
        }
        cursor.resume();
        if (cursor.advance(m->start(), m->end())) {
            return Captures(subject, std::move(locs), re->nameIndex);
        }
    }
    return std::nullopt;
}

} // namespace pcrekit
