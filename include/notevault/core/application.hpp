/*
 * notevault C++17 - Application
 *
 * Central application singleton managing the lifecycle of all components:
 * command line, configuration, logging, vault root, tool providers and the
 * MCP stdio loop.
 */
#ifndef notevault_CORE_APPLICATION_HPP
#define notevault_CORE_APPLICATION_HPP

#include <notevault/core/config.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace notevault {

class VaultToolsProvider;

namespace mcp {
class McpServer;
}

struct AppInfo {
    static constexpr const char* NAME = "notevault";
    static constexpr const char* VERSION = "1.0.0";
    static constexpr const char* DEFAULT_SERVER_NAME = "obsidian-notes";
};

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();

    // Returns false when the process should exit without serving:
    // after --help/--version (exit_code() == 0) or on a fatal
    // configuration error (exit_code() == 1).
    bool init(int argc, char* argv[]);

    // Serve MCP over stdin/stdout until EOF or a shutdown signal.
    int run();
    void shutdown();

    void stop();
    int exit_code() const { return exit_code_; }

    Config& config() { return config_; }

private:
    Application();
    ~Application();
    Application(const Application&);
    Application& operator=(const Application&);

    // Returns false for --help/--version and for malformed arguments.
    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    bool setup_vault();
    bool setup_tools();
    void setup_signals();

    Config config_;
    std::string config_file_;
    std::string vault_arg_;
    std::string log_level_arg_;
    int exit_code_;

    std::atomic<bool> running_;
    std::unique_ptr<VaultToolsProvider> vault_tools_;
    std::unique_ptr<mcp::McpServer> server_;
};

} // namespace notevault

#endif // notevault_CORE_APPLICATION_HPP
