/*
 * notevault C++17 - Guarded Writer Implementation
 */
#include <notevault/core/file_writer.hpp>
#include <notevault/core/inventory.hpp>
#include <notevault/core/limits.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/path_validator.hpp>
#include <notevault/core/scoped_fd.hpp>
#include <notevault/core/symlink_guard.hpp>

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace notevault {

namespace {

bool in_inventory(const std::vector<InventoryEntry>& entries, const std::string& path) {
    for (size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].path == path) return true;
    }
    return false;
}

GuardResult write_all(int fd, const std::string& content, const std::string& full) {
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return GuardResult::fail(GuardError::UnexpectedIO,
                "write '" + full + "': " + strerror(errno));
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }
    return GuardResult::ok();
}

} // namespace

GuardResult write_file(const std::string& root,
                       const std::string& relative_path,
                       const std::string& content,
                       WriteOutcome& outcome) {
    std::string full;
    GuardResult r = path_guard::validate_write_path(root, relative_path, full);
    if (!r) {
        LOG_WARN("[writer] Rejected '%s': %s", relative_path.c_str(), guard_error_name(r.code));
        return r;
    }

    if (content.size() > limits::kMaxWriteBytes) {
        return GuardResult::fail(GuardError::InvalidArgument,
            "Content exceeds maximum size of 1000000 bytes.");
    }

    std::vector<InventoryEntry> entries;
    r = list_files(root, entries);
    if (!r) return r;
    bool existed = in_inventory(entries, full.substr(root.size() + 1));

    r = symlink_guard::ensure_parent_directories(full, root);
    if (!r) return r;

    r = symlink_guard::assert_no_symlinked_ancestors(full, root);
    if (!r) return r;

    ScopedFd fd;
    r = symlink_guard::open_for_write(full, fd);
    if (!r) return r;

    r = write_all(fd.get(), content, full);
    if (!r) return r;

    r = symlink_guard::verify_same_file(fd, full);
    if (!r) return r;

    if (fd.close() != 0) {
        return GuardResult::fail(GuardError::UnexpectedIO,
            "close '" + full + "': " + strerror(errno));
    }

    outcome = existed ? WriteOutcome::Updated : WriteOutcome::Created;
    LOG_INFO("[writer] %s %s (%zu bytes)",
             existed ? "Updated" : "Created", relative_path.c_str(), content.size());
    return GuardResult::ok();
}

} // namespace notevault
