/*
 * notevault C++17 - MCP server for an Obsidian vault
 *
 * Usage:
 *   ./notevault [--config config.json] [--log-level debug] <vault_path>
 *
 * Speaks MCP (JSON-RPC 2.0) on stdin/stdout; logs go to stderr.
 */
#include <notevault/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = notevault::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
