/*
 * notevault C++17 - Symlink Guard
 *
 * Two escape vectors are closed here:
 *
 *   - an intermediate directory that is a symlink: closed by walking every
 *     existing ancestor between the target and the root with lstat(),
 *     after any missing directories have been created;
 *   - a final path component that is a symlink: closed by opening with
 *     O_NOFOLLOW, so the check and the open are one syscall.
 *
 * O_NOFOLLOW only polices the last component, so both are required.
 */
#ifndef notevault_CORE_SYMLINK_GUARD_HPP
#define notevault_CORE_SYMLINK_GUARD_HPP

#include <notevault/core/guard_result.hpp>
#include <notevault/core/scoped_fd.hpp>

#include <string>

namespace notevault {
namespace symlink_guard {

// Create the missing parent directories of `resolved` one component at a
// time, starting below `root`. Refuses to descend into a symlinked
// component. `resolved` must already have passed assert_containment.
GuardResult ensure_parent_directories(const std::string& resolved, const std::string& root);

// Walk from the parent of `resolved` up to (not including) `root`. Fails
// with SymlinkedParent if any existing directory on the way is a symlink.
GuardResult assert_no_symlinked_ancestors(const std::string& resolved, const std::string& root);

// open(O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW). ELOOP maps to
// SymlinkTarget. Anything but a regular file (a FIFO, a device) fails
// with UnexpectedIO instead of blocking.
GuardResult open_for_write(const std::string& resolved, ScopedFd& fd);

// open(O_RDONLY | O_NOFOLLOW). ELOOP maps to SymlinkTarget; non-regular
// files fail as in open_for_write.
GuardResult open_for_read(const std::string& resolved, ScopedFd& fd);

// After a write: the descriptor and the path must still name the same
// inode. A mismatch means the path was swapped while we held it open.
GuardResult verify_same_file(const ScopedFd& fd, const std::string& resolved);

} // namespace symlink_guard
} // namespace notevault

#endif // notevault_CORE_SYMLINK_GUARD_HPP
