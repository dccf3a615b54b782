#include <notevault/core/todo_scanner.hpp>
#include <notevault/core/file_reader.hpp>
#include <notevault/core/inventory.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/utils.hpp>

namespace notevault {

namespace {
const char kOpenBox[] = "- [ ] ";
const size_t kOpenBoxLen = sizeof(kOpenBox) - 1;
}

bool is_open_todo(const std::string& line) {
    size_t pos = line.find(kOpenBox);
    while (pos != std::string::npos) {
        if (pos + kOpenBoxLen < line.size()) {
            char next = line[pos + kOpenBoxLen];
            if (next != '\n' && next != '\r') return true;
        }
        pos = line.find(kOpenBox, pos + 1);
    }
    return false;
}

GuardResult scan_todos(const std::string& root, std::vector<TodoRecord>& out) {
    out.clear();

    std::vector<InventoryEntry> files;
    GuardResult r = list_files(root, files, ".md");
    if (!r) return r;

    for (size_t i = 0; i < files.size(); ++i) {
        std::string content;
        GuardResult read = read_bounded(root, files[i].path, content);
        if (!read) {
            if (read.code == GuardError::UnexpectedIO) {
                LOG_WARN("[todos] Skipping %s: %s", files[i].path.c_str(), read.message.c_str());
            } else {
                LOG_DEBUG("[todos] Skipping %s: %s", files[i].path.c_str(), read.message.c_str());
            }
            continue;
        }

        std::vector<std::string> lines = split(content, '\n');
        for (size_t l = 0; l < lines.size(); ++l) {
            if (is_open_todo(lines[l])) {
                out.push_back(TodoRecord(files[i].path, trim(lines[l])));
            }
        }
    }

    LOG_DEBUG("[todos] %zu open items across %zu markdown files", out.size(), files.size());
    return GuardResult::ok();
}

} // namespace notevault
