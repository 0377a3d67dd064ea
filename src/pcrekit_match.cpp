// PCREKit - Match and Capture Views Implementation
// Copyright (c) 2026 greenteng.com

#include "pcrekit_match.h"

#include <stdexcept>

namespace pcrekit {

// ============================================================================
// Match
// ============================================================================

Match::Match(std::string_view s, size_t start, size_t end)
    : subject(s), startOffset(start), endOffset(end) {}

bool Match::operator==(const Match& other) const {
    return subject.data() == other.subject.data() &&
           subject.size() == other.subject.size() &&
           startOffset == other.startOffset &&
           endOffset == other.endOffset;
}

// ============================================================================
// CaptureLocations
// ============================================================================

CaptureLocations::CaptureLocations(std::shared_ptr<const Code> c, MatchData d)
    : code(std::move(c)), data(std::move(d)) {}

CaptureLocations::CaptureLocations(const CaptureLocations& other)
    : code(other.code), data(other.data.getConfig(), *other.code) {}

CaptureLocations& CaptureLocations::operator=(const CaptureLocations& other) {
    if (this != &other) {
        CaptureLocations fresh(other);
        *this = std::move(fresh);
    }
    return *this;
}

std::optional<std::pair<size_t, size_t>> CaptureLocations::get(size_t i) const {
    if (i >= len()) {
        return std::nullopt;
    }
    const PCRE2_SIZE* ovector = data.ovector();
    PCRE2_SIZE s = ovector[i * 2];
    PCRE2_SIZE e = ovector[i * 2 + 1];
    if (s == PCRE2_UNSET || e == PCRE2_UNSET) {
        return std::nullopt;
    }
    return std::make_pair(static_cast<size_t>(s), static_cast<size_t>(e));
}

// ============================================================================
// Captures
// ============================================================================

Captures::Captures(std::string_view s, CaptureLocations l, std::shared_ptr<const NameIndex> i)
    : subject(s), locs(std::move(l)), idx(std::move(i)) {}

std::optional<Match> Captures::get(size_t i) const {
    auto loc = locs.get(i);
    if (!loc) {
        return std::nullopt;
    }
    return Match(subject, loc->first, loc->second);
}

std::optional<Match> Captures::name(std::string_view name) const {
    auto it = idx->find(std::string(name));
    if (it == idx->end()) {
        return std::nullopt;
    }
    return get(it->second);
}

std::string_view Captures::operator[](size_t i) const {
    auto m = get(i);
    if (!m) {
        throw std::out_of_range("no group at index '" + std::to_string(i) + "'");
    }
    return m->asBytes();
}

std::string_view Captures::operator[](std::string_view name) const {
    auto m = this->name(name);
    if (!m) {
        throw std::out_of_range("no group named '" + std::string(name) + "'");
    }
    return m->asBytes();
}

} // namespace pcrekit
