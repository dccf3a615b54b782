/*
 * notevault C++17 - Vault Tools Implementation
 */
#include <notevault/core/vault_tools.hpp>
#include <notevault/core/config.hpp>
#include <notevault/core/file_reader.hpp>
#include <notevault/core/file_writer.hpp>
#include <notevault/core/inventory.hpp>
#include <notevault/core/limits.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/todo_scanner.hpp>
#include <notevault/core/utils.hpp>

#include <sstream>
#include <stdexcept>

namespace notevault {

namespace {

const char kListFailed[] = "Failed to list files.";
const char kReadFailed[] = "Failed to read files.";
const char kScanFailed[] = "Failed to scan TODOs.";
const char kWriteFailed[] = "Failed to write file.";

// Guard failures either pass through or collapse to `generic`.
AgentToolResult from_guard(const GuardResult& r, const char* generic) {
    if (r.is_safe_to_echo()) {
        return AgentToolResult::fail(r.message);
    }
    LOG_ERROR("%s (%s: %s)", generic, guard_error_name(r.code), r.message.c_str());
    return AgentToolResult::fail(generic);
}

} // namespace

VaultToolsProvider::VaultToolsProvider(const std::string& root)
    : root_(root) {}

VaultToolsProvider::~VaultToolsProvider() {
    shutdown();
}

bool VaultToolsProvider::init(const Config& cfg) {
    (void)cfg;
    if (root_.empty()) {
        LOG_ERROR("Vault tools need a vault root");
        return false;
    }

    LOG_INFO("Vault tools initialized (root=%s)", root_.c_str());
    initialized_ = true;
    return true;
}

void VaultToolsProvider::shutdown() {
    initialized_ = false;
}

AgentToolResult VaultToolsProvider::execute(const std::string& action, const Json& params) {
    if (action == "getAllFilenames") {
        return do_list(params);
    } else if (action == "readMultipleFiles") {
        return do_read(params);
    } else if (action == "getOpenTodos") {
        return do_todos(params);
    } else if (action == "updateFileContent") {
        return do_write(params);
    }
    return AgentToolResult::fail("Unknown action: " + action);
}

std::vector<AgentTool> VaultToolsProvider::get_agent_tools() const {
    std::vector<AgentTool> tools;
    VaultToolsProvider* self = const_cast<VaultToolsProvider*>(this);

    {
        AgentTool tool;
        tool.name = "getAllFilenames";
        tool.description = "Get a list of all filenames in the Obsidian vault. "
                           "Useful for retrieving their contents later.";
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return self->execute("getAllFilenames", params);
        };
        tools.push_back(tool);
    }

    {
        AgentTool tool;
        tool.name = "readMultipleFiles";
        tool.description = "Retrieves the contents of specified files from the Obsidian vault. "
                           "You can provide exact filenames (with or without path), partial filenames, "
                           "or case-insensitive matches. If a file isn't found, it will indicate that "
                           "in the response. Each file's content is prefixed with '# File: filename' "
                           "for clear identification.";
        tool.params.push_back(ToolParamSchema(
            "filenames", "array",
            "Names or paths of the files to read (at most 50)",
            true, "string"
        ));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return self->execute("readMultipleFiles", params);
        };
        tools.push_back(tool);
    }

    {
        AgentTool tool;
        tool.name = "getOpenTodos";
        tool.description = "Retrieves all open TODO items in the Obsidian vault with their file "
                           "locations. Useful for getting an overview of pending tasks.";
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return self->execute("getOpenTodos", params);
        };
        tools.push_back(tool);
    }

    {
        AgentTool tool;
        tool.name = "updateFileContent";
        tool.description = "Updates the content of a specified file in the Obsidian vault with new "
                           "markdown content. If the file doesn't exist, it will be created. "
                           "Note: if updating an existing file, you need to include both the old "
                           "and new content in a single Markdown string.";
        tool.params.push_back(ToolParamSchema(
            "filePath", "string",
            "The path of the file to update, relative to the vault root",
            true
        ));
        tool.params.push_back(ToolParamSchema(
            "content", "string",
            "The markdown content to write to the file",
            true
        ));
        tool.execute = [self](const Json& params) -> AgentToolResult {
            return self->execute("updateFileContent", params);
        };
        tools.push_back(tool);
    }

    return tools;
}

AgentToolResult VaultToolsProvider::do_list(const Json& params) const {
    (void)params;
    try {
        std::vector<InventoryEntry> entries;
        GuardResult r = list_files(root_, entries);
        if (!r) {
            return from_guard(r, kListFailed);
        }

        std::string header = "# All markdown files in vault (note: today's date is " +
                             format_date(current_timestamp()) + ")";
        return AgentToolResult::ok(header + "\n\n" + join(inventory_paths(entries), "\n"));
    } catch (const std::exception& e) {
        LOG_ERROR("getAllFilenames failed: %s", e.what());
        return AgentToolResult::fail(kListFailed);
    }
}

AgentToolResult VaultToolsProvider::do_read(const Json& params) const {
    if (!params.is_object() || !params.contains("filenames")) {
        return AgentToolResult::fail("Missing required parameter: filenames");
    }
    const Json& list = params["filenames"];
    if (!list.is_array()) {
        return AgentToolResult::fail("Parameter filenames must be an array of strings.");
    }
    if (list.size() > limits::kMaxNamesPerRead) {
        return AgentToolResult::fail("Too many filenames requested (maximum is 50).");
    }

    std::vector<std::string> names;
    names.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        if (!list[i].is_string()) {
            return AgentToolResult::fail("Parameter filenames must be an array of strings.");
        }
        names.push_back(list[i].get<std::string>());
    }

    try {
        std::string rendered;
        GuardResult r = read_files_by_name(root_, names, rendered);
        if (!r) {
            return from_guard(r, kReadFailed);
        }
        return AgentToolResult::ok(rendered);
    } catch (const std::exception& e) {
        LOG_ERROR("readMultipleFiles failed: %s", e.what());
        return AgentToolResult::fail(kReadFailed);
    }
}

AgentToolResult VaultToolsProvider::do_todos(const Json& params) const {
    (void)params;
    try {
        std::vector<TodoRecord> todos;
        GuardResult r = scan_todos(root_, todos);
        if (!r) {
            return from_guard(r, kScanFailed);
        }

        if (todos.empty()) {
            return AgentToolResult::ok("No open TODOs found in the vault.");
        }

        std::ostringstream out;
        out << "# Open TODOs in vault (" << todos.size() << " items)\n";
        for (size_t i = 0; i < todos.size(); ++i) {
            out << "\n- **" << todos[i].path << "**: " << todos[i].line;
        }
        return AgentToolResult::ok(out.str());
    } catch (const std::exception& e) {
        LOG_ERROR("getOpenTodos failed: %s", e.what());
        return AgentToolResult::fail(kScanFailed);
    }
}

AgentToolResult VaultToolsProvider::do_write(const Json& params) const {
    if (!params.is_object() || !params.contains("filePath") || !params["filePath"].is_string()) {
        return AgentToolResult::fail("Missing required parameter: filePath");
    }
    if (!params.contains("content") || !params["content"].is_string()) {
        return AgentToolResult::fail("Missing required parameter: content");
    }

    const std::string file_path = params["filePath"].get<std::string>();
    const std::string& content = params["content"].get_ref<const std::string&>();
    if (content.size() > limits::kMaxWriteBytes) {
        return AgentToolResult::fail("Content exceeds maximum size of 1000000 bytes.");
    }

    try {
        WriteOutcome outcome = WriteOutcome::Created;
        GuardResult r = write_file(root_, file_path, content, outcome);
        if (!r) {
            return from_guard(r, kWriteFailed);
        }

        if (outcome == WriteOutcome::Updated) {
            return AgentToolResult::ok("Successfully updated existing file: " + file_path);
        }
        return AgentToolResult::ok("Successfully created new file: " + file_path);
    } catch (const std::exception& e) {
        LOG_ERROR("updateFileContent failed: %s", e.what());
        return AgentToolResult::fail(kWriteFailed);
    }
}

} // namespace notevault
