// PCREKit - Match Iteration
// Copyright (c) 2026 greenteng.com
//
// Lazy, single-pass iteration over all non-overlapping matches of a regex
// in a subject. Both iterators borrow the Regex and the subject; neither
// may outlive them.

#ifndef PCREKIT_ITER_H
#define PCREKIT_ITER_H

#include "pcrekit_match.h"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace pcrekit {

class Regex;

// ============================================================================
// MatchCursor - advancement rule shared by both iterators
// ============================================================================

// After a non-empty match the next search starts at its end. After an empty
// match it starts one byte later, and an empty match ending where the
// previous yielded match ended is skipped rather than yielded.
class MatchCursor {
public:
    size_t position() const { return lastEnd; }

    bool exhausted(size_t subjectLen) const { return stopped || lastEnd > subjectLen; }

    // Ends the sequence for good (no match found, or the search failed)
    void stop() { stopped = true; }
    void resume() { stopped = false; }

    // Record the match [start, end). Returns false if it must be skipped.
    bool advance(size_t start, size_t end);

private:
    size_t lastEnd = 0;
    std::optional<size_t> lastMatch;
    bool stopped = false;
};

// ============================================================================
// CursorIterator - input iterator adaptor for range-for
// ============================================================================

// Copies share the current item, so move-only items such as Captures still
// give a copyable iterator. Single pass: incrementing one copy invalidates
// the others.
template <typename Source, typename Item>
class CursorIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Item;
    using difference_type = std::ptrdiff_t;
    using pointer = const Item*;
    using reference = const Item&;

    CursorIterator() = default;
    explicit CursorIterator(Source* src) : source(src) { ++*this; }

    reference operator*() const { return *current; }
    pointer operator->() const { return current.get(); }

    // Propagates the search error, after which this iterator equals end()
    CursorIterator& operator++() {
        Source* src = source;
        source = nullptr;
        current.reset();
        std::optional<Item> item = src->next();
        if (item) {
            current = std::make_shared<const Item>(std::move(*item));
            source = src;
        }
        return *this;
    }

    bool operator==(const CursorIterator& other) const { return source == other.source; }
    bool operator!=(const CursorIterator& other) const { return source != other.source; }

private:
    Source* source = nullptr;
    std::shared_ptr<const Item> current;
};

// ============================================================================
// Matches - yields Match values
// ============================================================================

class Matches {
public:
    using iterator = CursorIterator<Matches, Match>;

    // The next match, or nullopt once the sequence has ended.
    // Throws MatchError once; later calls return nullopt.
    std::optional<Match> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    friend class Regex;

    Matches(const Regex& re, std::string_view subject);

    const Regex* re;
    std::string_view subject;
    MatchCursor cursor;
};

// ============================================================================
// CaptureMatches - yields Captures values
// ============================================================================

// Each yielded Captures owns a freshly allocated CaptureLocations, so
// earlier results are never overwritten by later searches.
class CaptureMatches {
public:
    using iterator = CursorIterator<CaptureMatches, Captures>;

    // Same contract as Matches::next
    std::optional<Captures> next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    friend class Regex;

    CaptureMatches(const Regex& re, std::string_view subject);

    const Regex* re;
    std::string_view subject;
    MatchCursor cursor;
};

} // namespace pcrekit

#endif // PCREKIT_ITER_H
