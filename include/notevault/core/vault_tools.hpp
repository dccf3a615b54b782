/*
 * notevault C++17 - Vault Tools
 *
 * The four tools exposed to the agent:
 * - getAllFilenames: list every file in the vault, newest first
 * - readMultipleFiles: read files by exact, case-insensitive or partial name
 * - getOpenTodos: collect unchecked "- [ ]" items from Markdown files
 * - updateFileContent: create or overwrite a file through the write guards
 *
 * Each action is an operation boundary: guard failures that are safe to
 * echo come back verbatim, anything else is logged and replaced with a
 * generic message.
 */
#ifndef notevault_CORE_VAULT_TOOLS_HPP
#define notevault_CORE_VAULT_TOOLS_HPP

#include <notevault/core/tool.hpp>

#include <string>

namespace notevault {

class VaultToolsProvider : public ToolProvider {
public:
    // `root` must be the canonical vault path (see VaultRoot).
    explicit VaultToolsProvider(const std::string& root);
    virtual ~VaultToolsProvider();

    // Plugin interface
    const char* name() const override { return "vault_tools"; }
    const char* description() const override {
        return "Obsidian vault filesystem tools";
    }
    const char* version() const override { return "1.0.0"; }

    bool init(const Config& cfg) override;
    void shutdown() override;

    // ToolProvider interface
    AgentToolResult execute(const std::string& action, const Json& params) override;
    std::vector<AgentTool> get_agent_tools() const override;

    const std::string& root() const { return root_; }

private:
    std::string root_;

    AgentToolResult do_list(const Json& params) const;
    AgentToolResult do_read(const Json& params) const;
    AgentToolResult do_todos(const Json& params) const;
    AgentToolResult do_write(const Json& params) const;
};

} // namespace notevault

#endif // notevault_CORE_VAULT_TOOLS_HPP
