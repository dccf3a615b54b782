/*
 * notevault C++17 - Todo Scanner
 *
 * Collects unchecked checklist lines ("- [ ] something") from every
 * Markdown file in the inventory. Symlinks and dot-paths are already gone
 * from the inventory; oversized or unreadable files are skipped.
 */
#ifndef notevault_CORE_TODO_SCANNER_HPP
#define notevault_CORE_TODO_SCANNER_HPP

#include <notevault/core/guard_result.hpp>

#include <string>
#include <vector>

namespace notevault {

struct TodoRecord {
    std::string path;   // relative to the vault root
    std::string line;   // trimmed source line

    TodoRecord() {}
    TodoRecord(const std::string& p, const std::string& l) : path(p), line(l) {}
};

// True for lines containing "- [ ] " followed by at least one character.
bool is_open_todo(const std::string& line);

// Records in inventory order (newest file first), then line order.
GuardResult scan_todos(const std::string& root, std::vector<TodoRecord>& out);

} // namespace notevault

#endif // notevault_CORE_TODO_SCANNER_HPP
