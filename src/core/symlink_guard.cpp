/*
 * notevault C++17 - Symlink Guard Implementation
 */
#include <notevault/core/symlink_guard.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>

namespace notevault {
namespace symlink_guard {

namespace {

GuardResult io_failure(const char* what, const std::string& path, int err) {
    return GuardResult::fail(GuardError::UnexpectedIO,
        std::string(what) + " '" + path + "': " + strerror(err));
}

GuardResult symlinked_parent() {
    return GuardResult::fail(GuardError::SymlinkedParent,
        "Cannot write through a symlinked directory.");
}

// Descriptors are opened O_NONBLOCK so a FIFO cannot stall the open.
// Only regular files are accepted; the flag is cleared again afterwards.
GuardResult require_regular_file(int fd, const std::string& path) {
    struct stat st;
    if (fstat(fd, &st) != 0) {
        return io_failure("fstat", path, errno);
    }
    if (!S_ISREG(st.st_mode)) {
        return GuardResult::fail(GuardError::UnexpectedIO,
            "'" + path + "' is not a regular file");
    }

    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
        return io_failure("fcntl", path, errno);
    }
    return GuardResult::ok();
}

GuardResult symlink_target() {
    return GuardResult::fail(GuardError::SymlinkTarget,
        "Cannot write to a symbolic link.");
}

} // namespace

GuardResult ensure_parent_directories(const std::string& resolved, const std::string& root) {
    if (resolved.size() <= root.size() + 1) {
        return GuardResult::fail(GuardError::Containment, "File path escapes the vault directory.");
    }

    std::string relative_parent = parent_path(resolved.substr(root.size() + 1));
    if (relative_parent.empty()) {
        return GuardResult::ok();
    }

    std::vector<std::string> segments = split(relative_parent, '/');
    std::string current = root;

    for (size_t i = 0; i < segments.size(); ++i) {
        if (segments[i].empty()) continue;
        current += "/" + segments[i];

        struct stat st;
        if (lstat(current.c_str(), &st) != 0) {
            if (errno != ENOENT) {
                return io_failure("lstat", current, errno);
            }
            if (mkdir(current.c_str(), 0755) == 0) {
                LOG_DEBUG("[symlink_guard] Created directory %s", current.c_str());
            } else if (errno != EEXIST) {
                return io_failure("mkdir", current, errno);
            }
            // Re-check: something may have been planted between lstat and mkdir
            if (lstat(current.c_str(), &st) != 0) {
                return io_failure("lstat", current, errno);
            }
        }

        if (S_ISLNK(st.st_mode)) {
            LOG_WARN("[symlink_guard] Refusing to descend into symlink %s", current.c_str());
            return symlinked_parent();
        }
        if (!S_ISDIR(st.st_mode)) {
            return io_failure("not a directory", current, ENOTDIR);
        }
    }

    return GuardResult::ok();
}

GuardResult assert_no_symlinked_ancestors(const std::string& resolved, const std::string& root) {
    std::string dir = parent_path(resolved);

    while (dir.size() > root.size() && starts_with(dir, root + "/")) {
        struct stat st;
        if (lstat(dir.c_str(), &st) == 0) {
            if (S_ISLNK(st.st_mode)) {
                LOG_WARN("[symlink_guard] Symlinked ancestor %s", dir.c_str());
                return symlinked_parent();
            }
        } else if (errno != ENOENT && errno != ENOTDIR) {
            return io_failure("lstat", dir, errno);
        }
        dir = parent_path(dir);
    }

    return GuardResult::ok();
}

GuardResult open_for_write(const std::string& resolved, ScopedFd& fd) {
    int raw = open(resolved.c_str(),
                   O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK, 0644);
    if (raw < 0) {
        if (errno == ELOOP) {
            LOG_WARN("[symlink_guard] O_NOFOLLOW refused symlink %s", resolved.c_str());
            return symlink_target();
        }
        return io_failure("open for write", resolved, errno);
    }

    ScopedFd opened(raw);
    GuardResult r = require_regular_file(opened.get(), resolved);
    if (!r) return r;

    fd.reset(opened.release());
    return GuardResult::ok();
}

GuardResult open_for_read(const std::string& resolved, ScopedFd& fd) {
    int raw = open(resolved.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK);
    if (raw < 0) {
        if (errno == ELOOP) {
            return GuardResult::fail(GuardError::SymlinkTarget, "Cannot read a symbolic link.");
        }
        if (errno == ENOENT) {
            return GuardResult::fail(GuardError::NotFound, "File not found in vault.");
        }
        return io_failure("open for read", resolved, errno);
    }

    ScopedFd opened(raw);
    GuardResult r = require_regular_file(opened.get(), resolved);
    if (!r) return r;

    fd.reset(opened.release());
    return GuardResult::ok();
}

GuardResult verify_same_file(const ScopedFd& fd, const std::string& resolved) {
    struct stat fd_stat;
    struct stat path_stat;
    if (fstat(fd.get(), &fd_stat) != 0) {
        return io_failure("fstat", resolved, errno);
    }
    if (lstat(resolved.c_str(), &path_stat) != 0) {
        return io_failure("lstat", resolved, errno);
    }
    if (fd_stat.st_dev != path_stat.st_dev || fd_stat.st_ino != path_stat.st_ino) {
        return GuardResult::fail(GuardError::UnexpectedIO,
            "TOCTOU race detected: '" + resolved + "' changed while open");
    }
    return GuardResult::ok();
}

} // namespace symlink_guard
} // namespace notevault
