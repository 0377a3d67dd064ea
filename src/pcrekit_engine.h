// PCREKit - PCRE2 Engine Bindings
// Copyright (c) 2026 greenteng.com
//
// Thin RAII owners for the PCRE2 objects the rest of the library needs:
// compile contexts, compiled code and match data (the search scratch).
// Nothing above this layer calls pcre2_* directly.

#ifndef PCREKIT_ENGINE_H
#define PCREKIT_ENGINE_H

#ifndef PCRE2_CODE_UNIT_WIDTH
#define PCRE2_CODE_UNIT_WIDTH 8
#endif
#include <pcre2.h>

#include "pcrekit_config.h"

#include <stdint.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pcrekit {

// ============================================================================
// CompileContext
// ============================================================================

class CompileContext {
public:
    CompileContext();
    ~CompileContext();

    CompileContext(const CompileContext&) = delete;
    CompileContext& operator=(const CompileContext&) = delete;

    // Set the newline convention (one of the PCRE2_NEWLINE_* values).
    // Throws std::invalid_argument if the engine rejects the value.
    void setNewline(uint32_t value);

    pcre2_compile_context* get() const { return ctx; }

private:
    pcre2_compile_context* ctx = nullptr;
};

// ============================================================================
// Code - a compiled pattern
// ============================================================================

// Safe to share between threads once constructed and JIT compiled: PCRE2
// only reads the code block while matching.
class Code {
public:
    // Throws CompileError (kind Compile) with the engine's offset
    Code(std::string_view pattern, uint32_t options, const CompileContext& ctx);
    ~Code();

    Code(const Code&) = delete;
    Code& operator=(const Code&) = delete;

    // Throws CompileError (kind Jit)
    void jitCompile();

    bool isJitCompiled() const { return jitCompiled; }

    // One entry per capture group, index 0 (the whole match) always unnamed.
    // Throws CompileError (kind Info).
    std::vector<std::optional<std::string>> captureNames() const;

    // Number of capture groups including group 0.
    // Throws CompileError (kind Info).
    size_t captureCount() const;

    const pcre2_code* get() const { return code; }

private:
    pcre2_code* code = nullptr;
    bool jitCompiled = false;

    template <typename T>
    T patternInfo(uint32_t what) const;
};

// ============================================================================
// MatchData - per-search scratch
// ============================================================================

// Owns the ovector a search writes into, plus the match context and the
// optional JIT stack. Must only be used with the Code it was created for,
// and by one search at a time.
class MatchData {
public:
    // Throws std::invalid_argument if config asks for a 0 byte JIT stack
    MatchData(const MatchConfig& config, const Code& code);
    ~MatchData();

    MatchData(MatchData&& other) noexcept;
    MatchData& operator=(MatchData&& other) noexcept;

    MatchData(const MatchData&) = delete;
    MatchData& operator=(const MatchData&) = delete;

    const MatchConfig& getConfig() const { return config; }

    // Search `subject` from byte offset `start`. Returns true and fills the
    // ovector on a match, false if there is no match.
    // Throws MatchError for every other engine result.
    //
    // When `options` contains PCRE2_NO_UTF_CHECK and the code was compiled
    // in UTF mode, `subject` must be valid UTF-8. The engine's behavior is
    // undefined otherwise.
    bool find(const Code& code, std::string_view subject, size_t start, uint32_t options);

    // Flat start/end pairs, PCRE2_UNSET for groups that did not participate
    const PCRE2_SIZE* ovector() const { return ovectorPtr; }

    // Number of entries in ovector(), always twice the number of groups
    size_t ovectorLen() const { return static_cast<size_t>(ovectorCount) * 2; }

private:
    MatchConfig config;
    pcre2_match_context* matchContext = nullptr;
    pcre2_match_data* matchData = nullptr;
    pcre2_jit_stack* jitStack = nullptr;
    PCRE2_SIZE* ovectorPtr = nullptr;
    uint32_t ovectorCount = 0;

    void release();
};

// Whether the linked PCRE2 library was built with JIT support
bool jitAvailable();

} // namespace pcrekit

#endif // PCREKIT_ENGINE_H
