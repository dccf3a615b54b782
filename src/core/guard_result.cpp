#include <notevault/core/guard_result.hpp>

namespace notevault {

const char* guard_error_name(GuardError code) {
    switch (code) {
        case GuardError::None: return "none";
        case GuardError::Config: return "config";
        case GuardError::NullByte: return "null_byte";
        case GuardError::DotSegment: return "dot_segment";
        case GuardError::Extension: return "extension";
        case GuardError::PathLength: return "path_length";
        case GuardError::PathDepth: return "path_depth";
        case GuardError::Containment: return "containment";
        case GuardError::InvalidArgument: return "invalid_argument";
        case GuardError::SymlinkedParent: return "symlinked_parent";
        case GuardError::SymlinkTarget: return "symlink_target";
        case GuardError::TooLarge: return "too_large";
        case GuardError::NotFound: return "not_found";
        case GuardError::UnexpectedIO: return "unexpected_io";
    }
    return "unknown";
}

} // namespace notevault
