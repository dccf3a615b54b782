/*
 * notevault C++17 - Path Validator
 *
 * Independent checks applied to a caller-supplied relative path before it
 * touches the filesystem. Each check fails with its own GuardError code.
 * Callers run them in this order, since later checks assume the earlier
 * ones passed:
 *
 *   reject_null_bytes -> reject_dot_segments -> reject_disallowed_extension
 *     -> enforce_path_limits -> resolve_candidate -> assert_containment
 *
 * Dot-segment rejection covers both ".." traversal and hidden paths
 * (.git, .obsidian, ...). It also forbids legitimate dot-named notes.
 */
#ifndef notevault_CORE_PATH_VALIDATOR_HPP
#define notevault_CORE_PATH_VALIDATOR_HPP

#include <notevault/core/guard_result.hpp>

#include <string>
#include <vector>

namespace notevault {
namespace path_guard {

// Lowercase, dot-prefixed extensions accepted for writes.
const std::vector<std::string>& allowed_extensions();

// Final extension of the last segment, lowercased ("Notes/A.MD" -> ".md").
// Empty when the last segment has no dot after its first character.
std::string extension_of(const std::string& path);

GuardResult reject_null_bytes(const std::string& path);

GuardResult reject_dot_segments(const std::string& path);

GuardResult reject_disallowed_extension(const std::string& path);

GuardResult enforce_path_limits(const std::string& path);

// Join onto the root and normalize lexically. An absolute candidate is
// not joined; it replaces the root and is left for assert_containment to
// reject.
std::string resolve_candidate(const std::string& root, const std::string& candidate);

// `resolved` must start with `root` followed by '/'. The root itself is
// rejected.
GuardResult assert_containment(const std::string& resolved, const std::string& root);

// Full write-side chain. On success `resolved` holds the absolute target.
GuardResult validate_write_path(const std::string& root,
                                const std::string& candidate,
                                std::string& resolved);

} // namespace path_guard
} // namespace notevault

#endif // notevault_CORE_PATH_VALIDATOR_HPP
