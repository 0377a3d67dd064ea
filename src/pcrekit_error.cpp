// PCREKit - Error Types Implementation
// Copyright (c) 2026 greenteng.com

#include "pcrekit_error.h"
#include "pcrekit_engine.h"

namespace pcrekit {

// ============================================================================
// Message Formatting
// ============================================================================

std::string engineErrorMessage(int code) {
    PCRE2_UCHAR buffer[256];
    int rc = pcre2_get_error_message(code, buffer, sizeof(buffer));
    if (rc == PCRE2_ERROR_BADDATA) {
        return "unknown error code " + std::to_string(code);
    }
    // PCRE2_ERROR_NOMEMORY still leaves a truncated, terminated message
    return std::string(reinterpret_cast<const char*>(buffer));
}

static std::string formatError(ErrorKind kind, int code, std::optional<size_t> offset) {
    std::string msg = engineErrorMessage(code);
    switch (kind) {
        case ErrorKind::Compile:
            if (offset) {
                return "PCRE2: error compiling pattern at offset " + std::to_string(*offset) + ": " + msg;
            }
            return "PCRE2: error compiling pattern: " + msg;
        case ErrorKind::Jit:
            return "PCRE2: error JIT compiling pattern: " + msg;
        case ErrorKind::Info:
            return "PCRE2: error getting info from pattern: " + msg;
        case ErrorKind::Match:
            return "PCRE2: error matching: " + msg;
    }
    return "PCRE2: " + msg;
}

// ============================================================================
// Error
// ============================================================================

Error::Error(ErrorKind k, int c, std::optional<size_t> off)
    : std::runtime_error(formatError(k, c, off)), kind(k), code(c), offset(off) {}

std::string Error::errorMessage() const {
    return engineErrorMessage(code);
}

} // namespace pcrekit
