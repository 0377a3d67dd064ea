// PCREKit - Debug Formatting
// Copyright (c) 2026 greenteng.com
//
// Stream output for the public types, meant for logs and test failures.
// Subject bytes are escaped so binary input prints on one line.

#include "pcrekit_match.h"
#include "pcrekit_regex.h"

#include <map>
#include <ostream>

namespace pcrekit {

// ============================================================================
// Helpers
// ============================================================================

static void writeEscaped(std::ostream& os, std::string_view bytes) {
    static const char* hex = "0123456789ABCDEF";

    os << '"';
    for (char ch : bytes) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
            case '\n': os << "\\n"; break;
            case '\r': os << "\\r"; break;
            case '\t': os << "\\t"; break;
            case '\\': os << "\\\\"; break;
            case '"':  os << "\\\""; break;
            default:
                if (c >= 0x20 && c < 0x7F) {
                    os << ch;
                } else {
                    os << "\\x" << hex[c >> 4] << hex[c & 0x0F];
                }
                break;
        }
    }
    os << '"';
}

// ============================================================================
// Operators
// ============================================================================

std::ostream& operator<<(std::ostream& os, const Match& m) {
    return os << "Match(" << m.start() << ", " << m.end() << ")";
}

std::ostream& operator<<(std::ostream& os, const Regex& re) {
    os << "Regex(";
    writeEscaped(os, re.asStr());
    return os << ")";
}

std::ostream& operator<<(std::ostream& os, const CaptureLocations& locs) {
    const PCRE2_SIZE* ovector = locs.data.ovector();
    os << "CaptureLocations([";
    for (size_t i = 0; i < locs.data.ovectorLen(); i++) {
        if (i > 0) {
            os << ", ";
        }
        if (ovector[i] == PCRE2_UNSET) {
            os << "unset";
        } else {
            os << ovector[i];
        }
    }
    return os << "])";
}

std::ostream& operator<<(std::ostream& os, const Captures& caps) {
    // Reverse index so named groups print under their name
    std::map<size_t, const std::string*> slotNames;
    for (const auto& [name, slot] : *caps.idx) {
        slotNames[slot] = &name;
    }

    os << "Captures({";
    for (size_t slot = 0; slot < caps.len(); slot++) {
        if (slot > 0) {
            os << ", ";
        }
        auto named = slotNames.find(slot);
        if (named != slotNames.end()) {
            os << *named->second;
        } else {
            os << slot;
        }
        os << ": ";

        auto m = caps.get(slot);
        if (m) {
            writeEscaped(os, m->asBytes());
        } else {
            os << "unset";
        }
    }
    return os << "})";
}

} // namespace pcrekit
