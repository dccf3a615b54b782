/*
 * notevault C++17 - Bounded Reader Implementation
 */
#include <notevault/core/file_reader.hpp>
#include <notevault/core/inventory.hpp>
#include <notevault/core/limits.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/path_validator.hpp>
#include <notevault/core/scoped_fd.hpp>
#include <notevault/core/symlink_guard.hpp>
#include <notevault/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace notevault {

namespace {

GuardResult too_large() {
    return GuardResult::fail(GuardError::TooLarge, "File too large to read (limit is 10 MiB).");
}

std::string file_block(const std::string& path, const std::string& body) {
    return "# File: " + path + "\n\n" + body;
}

} // namespace

GuardResult read_bounded(const std::string& root,
                         const std::string& relative_path,
                         std::string& content) {
    std::string full = path_guard::resolve_candidate(root, relative_path);
    GuardResult r = path_guard::assert_containment(full, root);
    if (!r) {
        LOG_WARN("[reader] Containment check failed for '%s'", relative_path.c_str());
        return r;
    }

    ScopedFd fd;
    r = symlink_guard::open_for_read(full, fd);
    if (!r) return r;

    struct stat st;
    if (fstat(fd.get(), &st) != 0) {
        return GuardResult::fail(GuardError::UnexpectedIO,
            "fstat '" + full + "': " + strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        return GuardResult::fail(GuardError::UnexpectedIO, "not a regular file: '" + full + "'");
    }
    if (static_cast<uint64_t>(st.st_size) > limits::kMaxReadBytes) {
        LOG_DEBUG("[reader] %s is %lld bytes, over the read ceiling",
                  relative_path.c_str(), static_cast<long long>(st.st_size));
        return too_large();
    }

    std::string data;
    data.reserve(static_cast<size_t>(st.st_size));
    char buf[65536];
    for (;;) {
        ssize_t n = read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return GuardResult::fail(GuardError::UnexpectedIO,
                "read '" + full + "': " + strerror(errno));
        }
        if (n == 0) break;
        data.append(buf, static_cast<size_t>(n));
        // The file may have grown since fstat
        if (data.size() > limits::kMaxReadBytes) {
            return too_large();
        }
    }

    content.swap(data);
    return GuardResult::ok();
}

std::vector<NameMatch> resolve_names(const std::vector<std::string>& inventory,
                                     const std::vector<std::string>& names) {
    std::vector<std::string> lowered;
    std::vector<std::string> lowered_base;
    lowered.reserve(inventory.size());
    lowered_base.reserve(inventory.size());
    for (size_t i = 0; i < inventory.size(); ++i) {
        lowered.push_back(to_lower(inventory[i]));
        lowered_base.push_back(to_lower(base_name(inventory[i])));
    }

    std::vector<NameMatch> matches;
    matches.reserve(names.size());

    for (size_t n = 0; n < names.size(); ++n) {
        NameMatch match;
        match.requested = names[n];

        // 1. Exact
        if (std::find(inventory.begin(), inventory.end(), names[n]) != inventory.end()) {
            match.paths.push_back(names[n]);
            matches.push_back(match);
            continue;
        }

        // 2. Case-insensitive full path; the oldest of several wins
        std::string needle = to_lower(names[n]);
        std::vector<std::string>::const_reverse_iterator ci =
            std::find(lowered.crbegin(), lowered.crend(), needle);
        if (ci != lowered.crend()) {
            size_t index = static_cast<size_t>(lowered.crend() - ci) - 1;
            match.paths.push_back(inventory[index]);
            matches.push_back(match);
            continue;
        }

        // 3. Partial, base name only
        match.partial = true;
        for (size_t i = 0; i < inventory.size(); ++i) {
            if (lowered_base[i].find(needle) == std::string::npos) continue;
            if (match.paths.size() < limits::kMaxPartialMatches) {
                match.paths.push_back(inventory[i]);
            } else {
                ++match.suppressed;
            }
        }
        matches.push_back(match);
    }

    return matches;
}

GuardResult read_files_by_name(const std::string& root,
                               const std::vector<std::string>& names,
                               std::string& rendered) {
    rendered.clear();
    if (names.empty()) {
        rendered = "No matching files found in the vault.";
        return GuardResult::ok();
    }

    std::vector<InventoryEntry> entries;
    GuardResult r = list_files(root, entries);
    if (!r) return r;

    std::vector<NameMatch> matches = resolve_names(inventory_paths(entries), names);

    std::vector<std::string> blocks;
    for (size_t m = 0; m < matches.size(); ++m) {
        const NameMatch& match = matches[m];

        if (!match.found()) {
            blocks.push_back(file_block(match.requested, "File not found in vault."));
            continue;
        }

        for (size_t i = 0; i < match.paths.size(); ++i) {
            std::string content;
            GuardResult read = read_bounded(root, match.paths[i], content);
            if (read) {
                blocks.push_back(file_block(match.paths[i], content));
            } else if (read.is_safe_to_echo()) {
                blocks.push_back(file_block(match.paths[i], read.message));
            } else {
                LOG_ERROR("[reader] Read failed for %s: %s", match.paths[i].c_str(), read.message.c_str());
                blocks.push_back(file_block(match.paths[i], "Failed to read file."));
            }
        }

        if (match.suppressed > 0) {
            std::ostringstream note;
            if (match.suppressed == 1) {
                note << "# Note: 1 more file matches \"" << match.requested << "\" and was not shown.";
            } else {
                note << "# Note: " << match.suppressed << " more files match \"" << match.requested
                     << "\" and were not shown.";
            }
            note << " Please use a more specific name.";
            blocks.push_back(note.str());
        }
    }

    rendered = join(blocks, "\n\n");
    return GuardResult::ok();
}

} // namespace notevault
