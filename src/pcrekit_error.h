// PCREKit - Error Types
// Copyright (c) 2026 greenteng.com
//
// Exceptions raised for engine-reported failures. "No match" is never an
// error; only genuine failures of compilation or matching end up here.

#ifndef PCREKIT_ERROR_H
#define PCREKIT_ERROR_H

#include <optional>
#include <stdexcept>
#include <string>

namespace pcrekit {

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind {
    Compile,    // pcre2_compile rejected the pattern
    Jit,        // pcre2_jit_compile failed
    Info,       // pcre2_pattern_info failed
    Match       // pcre2_match failed with something other than "no match"
};

// ============================================================================
// Error - base for all engine failures
// ============================================================================

class Error : public std::runtime_error {
public:
    ErrorKind kind;
    int code;                       // raw PCRE2 error code
    std::optional<size_t> offset;   // pattern offset, compile errors only

    Error(ErrorKind k, int c, std::optional<size_t> off = std::nullopt);

    // The engine's own description of `code`, without any prefix
    std::string errorMessage() const;
};

// Raised while building a regex (kinds Compile, Jit and Info)
class CompileError : public Error {
public:
    CompileError(ErrorKind k, int c, std::optional<size_t> off = std::nullopt)
        : Error(k, c, off) {}
};

// Raised by a search. The regex and its scratch stay usable afterwards.
class MatchError : public Error {
public:
    explicit MatchError(int c) : Error(ErrorKind::Match, c) {}
};

// Text for a PCRE2 error code as reported by pcre2_get_error_message
std::string engineErrorMessage(int code);

} // namespace pcrekit

#endif // PCREKIT_ERROR_H
