// PCREKit - Regex Builder Implementation
// Copyright (c) 2026 greenteng.com
//
// Translates the builder's configuration into PCRE2 compile options, runs
// the compiler and the optional JIT pass, and collects group metadata.

#include "pcrekit_regex.h"
#include "pcrekit_platform.h"

#include <stdexcept>

namespace pcrekit {

// ============================================================================
// Build
// ============================================================================

Regex RegexBuilder::build(std::string_view pattern) const {
    uint32_t options = 0;
    if (config.caseless) {
        options |= PCRE2_CASELESS;
    }
    if (config.dotall) {
        options |= PCRE2_DOTALL;
    }
    if (config.extended) {
        options |= PCRE2_EXTENDED;
    }
    if (config.multiLine) {
        options |= PCRE2_MULTILINE;
    }
    if (config.ucp) {
        options |= PCRE2_UCP;
        options |= PCRE2_UTF;
    }
    if (config.utf) {
        options |= PCRE2_UTF;
    }
    if (config.neverUtf) {
        options |= PCRE2_NEVER_UTF;
    }

    CompileContext ctx;
    if (config.crlf) {
        ctx.setNewline(PCRE2_NEWLINE_ANYCRLF);
    }

    auto code = std::make_shared<Code>(pattern, options, ctx);
    switch (config.jit) {
        case JitChoice::Never:
            break;
        case JitChoice::Always:
            code->jitCompile();
            break;
        case JitChoice::Attempt:
            try {
                code->jitCompile();
            } catch (const CompileError& e) {
                PCREKIT_LOG("JIT compilation failed: %s", e.what());
            }
            break;
    }

    auto names = std::make_shared<CaptureNames>(code->captureNames());

    // Filled in group order, so with duplicate names the last group wins
    auto idx = std::make_shared<NameIndex>();
    for (size_t i = 0; i < names->size(); i++) {
        const auto& name = (*names)[i];
        if (name) {
            (*idx)[*name] = i;
        }
    }

    return Regex(std::make_shared<const Config>(config),
                 std::string(pattern),
                 std::move(code),
                 std::move(names),
                 std::move(idx));
}

// ============================================================================
// Options
// ============================================================================

RegexBuilder& RegexBuilder::caseless(bool yes) {
    config.caseless = yes;
    return *this;
}

RegexBuilder& RegexBuilder::dotall(bool yes) {
    config.dotall = yes;
    return *this;
}

RegexBuilder& RegexBuilder::extended(bool yes) {
    config.extended = yes;
    return *this;
}

RegexBuilder& RegexBuilder::multiLine(bool yes) {
    config.multiLine = yes;
    return *this;
}

RegexBuilder& RegexBuilder::crlf(bool yes) {
    config.crlf = yes;
    return *this;
}

RegexBuilder& RegexBuilder::ucp(bool yes) {
    config.ucp = yes;
    return *this;
}

RegexBuilder& RegexBuilder::utf(bool yes) {
    config.utf = yes;
    return *this;
}

RegexBuilder& RegexBuilder::neverUtf(bool yes) {
    config.neverUtf = yes;
    return *this;
}

RegexBuilder& RegexBuilder::unsafeDisableUtfCheck() {
    config.utfCheck = false;
    return *this;
}

RegexBuilder& RegexBuilder::jit(bool yes) {
    config.jit = yes ? JitChoice::Always : JitChoice::Never;
    return *this;
}

RegexBuilder& RegexBuilder::jitIfAvailable(bool yes) {
    config.jit = yes ? JitChoice::Attempt : JitChoice::Never;
    return *this;
}

RegexBuilder& RegexBuilder::maxJitStackSize(std::optional<size_t> bytes) {
    if (bytes && *bytes == 0) {
        throw std::invalid_argument("max JIT stack size must be greater than 0");
    }
    config.matchConfig.maxJitStackSize = bytes;
    return *this;
}

} // namespace pcrekit
