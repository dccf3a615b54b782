/*
 * notevault C++17 - Directory Enumerator Implementation
 */
#include <notevault/core/inventory.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/utils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <sys/stat.h>

namespace notevault {

namespace {

// Reads the visible names of one directory, sorted. Returns false if the
// directory could not be opened.
bool read_dir_names(const std::string& abs_dir, std::vector<std::string>& names) {
    DIR* dir = opendir(abs_dir.c_str());
    if (!dir) {
        return false;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        // Also drops "." and ".."
        if (entry->d_name[0] == '.') continue;
        names.push_back(entry->d_name);
    }
    closedir(dir);

    std::sort(names.begin(), names.end());
    return true;
}

void walk(const std::string& root,
          const std::string& rel_dir,
          const std::string& extension,
          std::vector<InventoryEntry>& out) {
    std::string abs_dir = rel_dir.empty() ? root : root + "/" + rel_dir;

    std::vector<std::string> names;
    if (!read_dir_names(abs_dir, names)) {
        LOG_WARN("[inventory] Skipping unreadable directory %s: %s", abs_dir.c_str(), strerror(errno));
        return;
    }

    for (size_t i = 0; i < names.size(); ++i) {
        std::string rel = rel_dir.empty() ? names[i] : rel_dir + "/" + names[i];
        std::string abs = root + "/" + rel;

        struct stat st;
        if (lstat(abs.c_str(), &st) != 0) {
            LOG_DEBUG("[inventory] lstat failed for %s: %s", abs.c_str(), strerror(errno));
            continue;
        }

        if (S_ISLNK(st.st_mode)) {
            continue;
        }
        if (S_ISDIR(st.st_mode)) {
            walk(root, rel, extension, out);
            continue;
        }
        if (!S_ISREG(st.st_mode)) {
            continue;
        }
        if (!extension.empty() && !ends_with(rel, extension)) {
            continue;
        }

        int64_t mtime = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
        out.push_back(InventoryEntry(rel, mtime));
    }
}

} // namespace

GuardResult list_files(const std::string& root,
                       std::vector<InventoryEntry>& out,
                       const std::string& extension) {
    out.clear();

    DIR* probe = opendir(root.c_str());
    if (!probe) {
        return GuardResult::fail(GuardError::UnexpectedIO,
            "opendir '" + root + "': " + strerror(errno));
    }
    closedir(probe);

    walk(root, "", extension, out);

    std::stable_sort(out.begin(), out.end(),
        [](const InventoryEntry& a, const InventoryEntry& b) {
            return a.mtime_ns > b.mtime_ns;
        });

    LOG_DEBUG("[inventory] %zu files under %s", out.size(), root.c_str());
    return GuardResult::ok();
}

std::vector<std::string> inventory_paths(const std::vector<InventoryEntry>& entries) {
    std::vector<std::string> paths;
    paths.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        paths.push_back(entries[i].path);
    }
    return paths;
}

} // namespace notevault
