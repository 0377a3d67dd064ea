// PCREKit - PCRE2 Engine Bindings Implementation
// Copyright (c) 2026 greenteng.com

#include "pcrekit_engine.h"
#include "pcrekit_error.h"
#include "pcrekit_platform.h"

#include <algorithm>
#include <new>
#include <stdexcept>
#include <utility>

namespace pcrekit {

// Default JIT stack size used by PCRE2 when no stack is assigned
static const size_t JIT_STACK_START = 32 * 1024;

// PCRE2 rejects a NULL subject or pattern pointer in older releases, even
// with a zero length
static const char EMPTY_INPUT[1] = {0};

static PCRE2_SPTR inputPointer(std::string_view text) {
    const char* p = text.empty() ? EMPTY_INPUT : text.data();
    return reinterpret_cast<PCRE2_SPTR>(p);
}

bool jitAvailable() {
    uint32_t available = 0;
    if (pcre2_config(PCRE2_CONFIG_JIT, &available) < 0) {
        return false;
    }
    return available != 0;
}

// ============================================================================
// CompileContext
// ============================================================================

CompileContext::CompileContext() {
    ctx = pcre2_compile_context_create(nullptr);
    if (!ctx) {
        throw std::bad_alloc();
    }
}

CompileContext::~CompileContext() {
    pcre2_compile_context_free(ctx);
}

void CompileContext::setNewline(uint32_t value) {
    int rc = pcre2_set_newline(ctx, value);
    if (rc != 0) {
        throw std::invalid_argument("invalid newline convention " + std::to_string(value));
    }
}

// ============================================================================
// Code
// ============================================================================

Code::Code(std::string_view pattern, uint32_t options, const CompileContext& ctx) {
    int errorcode = 0;
    PCRE2_SIZE erroroffset = 0;
    code = pcre2_compile(
        inputPointer(pattern),
        pattern.size(),
        options,
        &errorcode,
        &erroroffset,
        ctx.get()
    );
    if (!code) {
        throw CompileError(ErrorKind::Compile, errorcode, static_cast<size_t>(erroroffset));
    }
}

Code::~Code() {
    pcre2_code_free(code);
}

void Code::jitCompile() {
    int rc = pcre2_jit_compile(code, PCRE2_JIT_COMPLETE);
    if (rc != 0) {
        throw CompileError(ErrorKind::Jit, rc);
    }
    jitCompiled = true;
}

template <typename T>
T Code::patternInfo(uint32_t what) const {
    T value{};
    int rc = pcre2_pattern_info(code, what, &value);
    if (rc != 0) {
        throw CompileError(ErrorKind::Info, rc);
    }
    return value;
}

size_t Code::captureCount() const {
    return static_cast<size_t>(patternInfo<uint32_t>(PCRE2_INFO_CAPTURECOUNT)) + 1;
}

std::vector<std::optional<std::string>> Code::captureNames() const {
    std::vector<std::optional<std::string>> names(captureCount());

    uint32_t nameCount = patternInfo<uint32_t>(PCRE2_INFO_NAMECOUNT);
    if (nameCount == 0) {
        return names;
    }

    uint32_t entrySize = patternInfo<uint32_t>(PCRE2_INFO_NAMEENTRYSIZE);
    PCRE2_SPTR table = patternInfo<PCRE2_SPTR>(PCRE2_INFO_NAMETABLE);

    // Each entry: 2 byte big-endian group number, then the NUL-terminated name
    for (uint32_t i = 0; i < nameCount; i++) {
        PCRE2_SPTR entry = table + static_cast<size_t>(i) * entrySize;
        size_t group = (static_cast<size_t>(entry[0]) << 8) | entry[1];
        names.at(group) = std::string(reinterpret_cast<const char*>(entry + 2));
    }
    return names;
}

// ============================================================================
// MatchData
// ============================================================================

MatchData::MatchData(const MatchConfig& cfg, const Code& code) : config(cfg) {
    matchContext = pcre2_match_context_create(nullptr);
    if (!matchContext) {
        throw std::bad_alloc();
    }

    matchData = pcre2_match_data_create_from_pattern(code.get(), nullptr);
    if (!matchData) {
        release();
        throw std::bad_alloc();
    }

    if (config.maxJitStackSize && *config.maxJitStackSize == 0) {
        release();
        throw std::invalid_argument("max JIT stack size must be greater than 0");
    }

    if (config.maxJitStackSize && jitAvailable()) {
        size_t max = *config.maxJitStackSize;
        jitStack = pcre2_jit_stack_create(std::min(max, JIT_STACK_START), max, nullptr);
        if (!jitStack) {
            release();
            throw std::bad_alloc();
        }
        pcre2_jit_stack_assign(matchContext, nullptr, jitStack);
    }

    ovectorPtr = pcre2_get_ovector_pointer(matchData);
    ovectorCount = pcre2_get_ovector_count(matchData);

    // A fresh scratch reports every group as unset
    std::fill(ovectorPtr, ovectorPtr + ovectorLen(), PCRE2_UNSET);
}

MatchData::~MatchData() {
    release();
}

MatchData::MatchData(MatchData&& other) noexcept
    : config(std::move(other.config)),
      matchContext(std::exchange(other.matchContext, nullptr)),
      matchData(std::exchange(other.matchData, nullptr)),
      jitStack(std::exchange(other.jitStack, nullptr)),
      ovectorPtr(std::exchange(other.ovectorPtr, nullptr)),
      ovectorCount(std::exchange(other.ovectorCount, 0)) {}

MatchData& MatchData::operator=(MatchData&& other) noexcept {
    using std::swap;
    swap(config, other.config);
    swap(matchContext, other.matchContext);
    swap(matchData, other.matchData);
    swap(jitStack, other.jitStack);
    swap(ovectorPtr, other.ovectorPtr);
    swap(ovectorCount, other.ovectorCount);
    return *this;
}

void MatchData::release() {
    if (matchData) {
        pcre2_match_data_free(matchData);
        matchData = nullptr;
    }
    if (jitStack) {
        pcre2_jit_stack_free(jitStack);
        jitStack = nullptr;
    }
    if (matchContext) {
        pcre2_match_context_free(matchContext);
        matchContext = nullptr;
    }
    ovectorPtr = nullptr;
    ovectorCount = 0;
}

bool MatchData::find(const Code& code, std::string_view subject, size_t start, uint32_t options) {
    int rc = pcre2_match(
        code.get(),
        inputPointer(subject),
        subject.size(),
        start,
        options,
        matchData,
        matchContext
    );

    if (rc == PCRE2_ERROR_NOMATCH) {
        return false;
    }
    if (rc > 0) {
        return true;
    }
    // rc == 0 means the ovector was too small, which cannot happen for match
    // data created from the pattern; report it like any other failure
    PCREKIT_LOG("pcre2_match failed with code %d at offset %zu", rc, start);
    throw MatchError(rc);
}

} // namespace pcrekit
