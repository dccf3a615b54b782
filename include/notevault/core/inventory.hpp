/*
 * notevault C++17 - Directory Enumerator
 *
 * The single source of truth for "what exists in the vault". Listing,
 * name lookup and TODO scanning all start from this inventory, so they
 * inherit its exclusions:
 *
 *   - any entry whose name starts with '.' (dot-directories are not entered)
 *   - any symbolic link, to a file or to a directory (never traversed)
 *   - anything that is not a regular file
 */
#ifndef notevault_CORE_INVENTORY_HPP
#define notevault_CORE_INVENTORY_HPP

#include <notevault/core/guard_result.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace notevault {

struct InventoryEntry {
    std::string path;       // relative to the vault root, '/'-separated
    int64_t mtime_ns;       // lstat modification time

    InventoryEntry() : mtime_ns(0) {}
    InventoryEntry(const std::string& p, int64_t m) : path(p), mtime_ns(m) {}
};

// Recursively enumerate `root`, most recently modified first (stable on
// ties, with names visited in byte order). When `extension` is non-empty
// only files ending in it are returned, compared case-sensitively.
// Fails with UnexpectedIO only if `root` itself cannot be opened;
// unreadable subdirectories are skipped.
GuardResult list_files(const std::string& root,
                       std::vector<InventoryEntry>& out,
                       const std::string& extension = "");

std::vector<std::string> inventory_paths(const std::vector<InventoryEntry>& entries);

} // namespace notevault

#endif // notevault_CORE_INVENTORY_HPP
