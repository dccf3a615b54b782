/*
 * notevault C++17 - Bounded Reader
 *
 * Reads vault files under a hard size ceiling and resolves caller-supplied
 * names against the inventory.
 *
 * Lookup order for each requested name:
 *   1. exact relative path
 *   2. case-insensitive relative path
 *   3. case-insensitive substring of the base name (at most
 *      limits::kMaxPartialMatches files; the rest are counted, not read)
 */
#ifndef notevault_CORE_FILE_READER_HPP
#define notevault_CORE_FILE_READER_HPP

#include <notevault/core/guard_result.hpp>

#include <string>
#include <vector>

namespace notevault {

// Re-checks containment, opens with O_NOFOLLOW and rejects files larger
// than limits::kMaxReadBytes before reading a single byte.
GuardResult read_bounded(const std::string& root,
                         const std::string& relative_path,
                         std::string& content);

struct NameMatch {
    std::string requested;
    std::vector<std::string> paths;     // files to read, in inventory order
    size_t suppressed;                  // partial matches left out
    bool partial;

    NameMatch() : suppressed(0), partial(false) {}

    bool found() const { return !paths.empty(); }
};

std::vector<NameMatch> resolve_names(const std::vector<std::string>& inventory,
                                     const std::vector<std::string>& names);

// Resolve every name and render one text block per file, not-found name,
// or suppressed-match notice. Never fails for a single name; fails only if
// the inventory itself cannot be built.
GuardResult read_files_by_name(const std::string& root,
                               const std::vector<std::string>& names,
                               std::string& rendered);

} // namespace notevault

#endif // notevault_CORE_FILE_READER_HPP
