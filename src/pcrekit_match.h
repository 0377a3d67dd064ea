// PCREKit - Match and Capture Views
// Copyright (c) 2026 greenteng.com
//
// Borrowed views over a subject buffer. None of these types copy the
// subject: they are only valid while the buffer they were produced from is
// alive.

#ifndef PCREKIT_MATCH_H
#define PCREKIT_MATCH_H

#include "pcrekit_engine.h"

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace pcrekit {

class Regex;
class CaptureMatches;

using NameIndex = std::unordered_map<std::string, size_t>;

// ============================================================================
// Match - one match (or group) in a subject
// ============================================================================

class Match {
public:
    Match(std::string_view subject, size_t start, size_t end);

    // Byte offsets into the subject, start <= end
    size_t start() const { return startOffset; }
    size_t end() const { return endOffset; }

    // The matched bytes
    std::string_view asBytes() const {
        return subject.substr(startOffset, endOffset - startOffset);
    }

    bool operator==(const Match& other) const;
    bool operator!=(const Match& other) const { return !(*this == other); }

private:
    std::string_view subject;
    size_t startOffset;
    size_t endOffset;
};

// ============================================================================
// CaptureLocations - raw group offsets of the last search
// ============================================================================

// Owns its own scratch, so it can be reused across captures_read calls
// without touching the regex's per-thread cache. Copying yields a fresh,
// empty scratch of the same shape; offsets are never copied.
class CaptureLocations {
public:
    CaptureLocations(const CaptureLocations& other);
    CaptureLocations& operator=(const CaptureLocations& other);
    CaptureLocations(CaptureLocations&&) noexcept = default;
    CaptureLocations& operator=(CaptureLocations&&) noexcept = default;

    // Start and end of group `i`, or nullopt if `i` is out of range or the
    // group did not participate in the match
    std::optional<std::pair<size_t, size_t>> get(size_t i) const;

    // Number of groups including group 0, always >= 1
    size_t len() const { return data.ovectorLen() / 2; }

private:
    friend class Regex;

    CaptureLocations(std::shared_ptr<const Code> code, MatchData data);

    std::shared_ptr<const Code> code;
    MatchData data;

    friend std::ostream& operator<<(std::ostream& os, const CaptureLocations& locs);
};

// ============================================================================
// Captures - groups of a single match
// ============================================================================

// Group 0 is always the whole match and is never named. Move-only: the
// offsets live in the owned CaptureLocations.
class Captures {
public:
    Captures(Captures&&) noexcept = default;
    Captures& operator=(Captures&&) noexcept = default;
    Captures(const Captures&) = delete;
    Captures& operator=(const Captures&) = delete;

    // Group `i`, or nullopt if there is no such group or it did not match
    std::optional<Match> get(size_t i) const;

    // Group named `name`, or nullopt if there is no such name or it did not
    // match
    std::optional<Match> name(std::string_view name) const;

    size_t len() const { return locs.len(); }

    // Matched bytes of a group. Throws std::out_of_range if the group does
    // not exist or did not participate.
    std::string_view operator[](size_t i) const;
    std::string_view operator[](std::string_view name) const;

private:
    friend class Regex;
    friend class CaptureMatches;

    Captures(std::string_view subject, CaptureLocations locs, std::shared_ptr<const NameIndex> idx);

    std::string_view subject;
    CaptureLocations locs;
    std::shared_ptr<const NameIndex> idx;

    friend std::ostream& operator<<(std::ostream& os, const Captures& caps);
};

std::ostream& operator<<(std::ostream& os, const Match& m);
std::ostream& operator<<(std::ostream& os, const CaptureLocations& locs);
std::ostream& operator<<(std::ostream& os, const Captures& caps);

} // namespace pcrekit

#endif // PCREKIT_MATCH_H
