/*
 * notevault C++17 - Path Validator Implementation
 */
#include <notevault/core/path_validator.hpp>
#include <notevault/core/limits.hpp>
#include <notevault/core/utils.hpp>

#include <algorithm>

namespace notevault {
namespace path_guard {

const std::vector<std::string>& allowed_extensions() {
    static const std::vector<std::string> exts = {
        ".md", ".txt", ".csv", ".json", ".yaml", ".yml", ".canvas"
    };
    return exts;
}

std::string extension_of(const std::string& path) {
    std::string name = base_name(path);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return "";
    }
    return to_lower(name.substr(dot));
}

GuardResult reject_null_bytes(const std::string& path) {
    if (path.find('\0') != std::string::npos) {
        return GuardResult::fail(GuardError::NullByte, "File path contains null bytes.");
    }
    return GuardResult::ok();
}

GuardResult reject_dot_segments(const std::string& path) {
    std::vector<std::string> segments = split(path, '/');
    for (size_t i = 0; i < segments.size(); ++i) {
        if (!segments[i].empty() && segments[i][0] == '.') {
            return GuardResult::fail(GuardError::DotSegment,
                "Cannot write to dot-prefixed files or directories.");
        }
    }
    return GuardResult::ok();
}

GuardResult reject_disallowed_extension(const std::string& path) {
    std::string ext = extension_of(path);
    const std::vector<std::string>& allowed = allowed_extensions();

    if (!ext.empty() && std::find(allowed.begin(), allowed.end(), ext) != allowed.end()) {
        return GuardResult::ok();
    }

    return GuardResult::fail(GuardError::Extension,
        "File extension \"" + (ext.empty() ? std::string("(none)") : ext) +
        "\" is not allowed. Allowed extensions: " + join(allowed, ", "));
}

GuardResult enforce_path_limits(const std::string& path) {
    if (path.size() > limits::kMaxPathLength) {
        return GuardResult::fail(GuardError::PathLength,
            "File path exceeds maximum length of " +
            std::to_string(limits::kMaxPathLength) + " characters.");
    }

    std::vector<std::string> segments = split(path, '/');
    size_t depth = static_cast<size_t>(std::count_if(segments.begin(), segments.end(),
        [](const std::string& s) { return !s.empty(); }));
    if (depth > limits::kMaxPathDepth) {
        return GuardResult::fail(GuardError::PathDepth,
            "File path exceeds maximum depth of " +
            std::to_string(limits::kMaxPathDepth) + " levels.");
    }

    return GuardResult::ok();
}

std::string resolve_candidate(const std::string& root, const std::string& candidate) {
    if (!candidate.empty() && candidate[0] == '/') {
        return normalize_path(candidate);
    }
    return normalize_path(join_path(root, candidate));
}

GuardResult assert_containment(const std::string& resolved, const std::string& root) {
    if (root.empty() ||
        resolved.size() <= root.size() + 1 ||
        resolved.compare(0, root.size(), root) != 0 ||
        resolved[root.size()] != '/') {
        return GuardResult::fail(GuardError::Containment,
            "File path escapes the vault directory.");
    }
    return GuardResult::ok();
}

GuardResult validate_write_path(const std::string& root,
                                const std::string& candidate,
                                std::string& resolved) {
    GuardResult r = reject_null_bytes(candidate);
    if (!r) return r;

    r = reject_dot_segments(candidate);
    if (!r) return r;

    r = reject_disallowed_extension(candidate);
    if (!r) return r;

    r = enforce_path_limits(candidate);
    if (!r) return r;

    std::string full = resolve_candidate(root, candidate);
    r = assert_containment(full, root);
    if (!r) return r;

    resolved = full;
    return r;
}

} // namespace path_guard
} // namespace notevault
