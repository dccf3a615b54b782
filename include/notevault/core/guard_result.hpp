/*
 * notevault C++17 - Guard results
 *
 * Every check in the vault guard chain returns a GuardResult instead of
 * throwing. The code says which check failed; the message is what the
 * caller sees when the failure is safe to echo.
 */
#ifndef notevault_CORE_GUARD_RESULT_HPP
#define notevault_CORE_GUARD_RESULT_HPP

#include <string>

namespace notevault {

enum class GuardError {
    None = 0,

    // Configuration (fatal at startup)
    Config,

    // Validation
    NullByte,
    DotSegment,
    Extension,
    PathLength,
    PathDepth,
    Containment,
    InvalidArgument,

    // Symlinks
    SymlinkedParent,
    SymlinkTarget,

    TooLarge,
    NotFound,

    // Anything the OS reported that we did not anticipate. The native
    // message is logged, never returned.
    UnexpectedIO
};

const char* guard_error_name(GuardError code);

struct GuardResult {
    bool success;
    GuardError code;
    std::string message;

    GuardResult() : success(true), code(GuardError::None) {}

    static GuardResult ok() {
        return GuardResult();
    }

    static GuardResult fail(GuardError c, const std::string& msg) {
        GuardResult r;
        r.success = false;
        r.code = c;
        r.message = msg;
        return r;
    }

    explicit operator bool() const { return success; }

    // Validation, symlink, size and not-found messages carry no system
    // detail and may be returned to the caller verbatim.
    bool is_safe_to_echo() const {
        return !success && code != GuardError::UnexpectedIO && code != GuardError::Config;
    }
};

} // namespace notevault

#endif // notevault_CORE_GUARD_RESULT_HPP
