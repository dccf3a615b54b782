/*
 * notevault C++17 - Application Implementation
 *
 * Central application singleton managing the lifecycle of all components.
 */
#include <notevault/core/application.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/vault_root.hpp>
#include <notevault/core/vault_tools.hpp>
#include <notevault/mcp/server.hpp>

#include <iostream>
#include <csignal>
#include <cstring>
#include <unistd.h>

namespace notevault {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cerr << AppInfo::NAME << " - MCP server for an Obsidian vault\n\n"
              << "Usage: " << prog << " [options] <vault_path>\n\n"
              << "Options:\n"
              << "  -h, --help               Show this help message\n"
              << "  -v, --version            Show version\n"
              << "  --config <file>          Load settings from a JSON config file\n"
              << "  --log-level <level>      debug, info, warn or error (default: info)\n\n"
              << "Example:\n"
              << "  " << prog << " ~/Documents/MyVault\n";
}

void print_version() {
    std::cerr << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

// ============================================================================
// Signal Handler
// ============================================================================

namespace {
    void signal_handler(int sig) {
        (void)sig;
        Application::instance().stop();
    }
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : exit_code_(0)
    , running_(false)
{}

Application::~Application() {}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return false;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                LOG_ERROR("--config needs a file argument");
                exit_code_ = 1;
                return false;
            }
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (strcmp(argv[i], "--log-level") == 0) {
            if (i + 1 >= argc) {
                LOG_ERROR("--log-level needs a level argument");
                exit_code_ = 1;
                return false;
            }
            log_level_arg_ = std::string(argv[++i]);
            continue;
        }
        if (argv[i][0] == '-' && argv[i][1] != '\0') {
            LOG_ERROR("Unknown option: %s", argv[i]);
            print_usage(argv[0]);
            exit_code_ = 1;
            return false;
        }
        if (!vault_arg_.empty()) {
            LOG_ERROR("Unexpected extra argument: %s", argv[i]);
            exit_code_ = 1;
            return false;
        }
        vault_arg_ = std::string(argv[i]);
    }
    return true;
}

bool Application::load_config() {
    if (config_file_.empty()) {
        LOG_DEBUG("No config file given, using defaults");
    } else if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config from %s, aborting!", config_file_.c_str());
        return false;
    } else {
        LOG_INFO("Loaded config from %s", config_file_.c_str());
    }

    if (!vault_arg_.empty()) {
        config_.set_string("vault_path", vault_arg_);
    }
    if (!log_level_arg_.empty()) {
        config_.set_string("log_level", log_level_arg_);
    }
    return true;
}

void Application::setup_logging() {
    std::string log_level = config_.get_string("log_level", "info");

    LogLevel level = LogLevel::INFO;
    if (parse_log_level(log_level, level)) {
        Logger::instance().set_level(level);
    } else {
        LOG_WARN("Unknown log_level '%s', using info", log_level.c_str());
        Logger::instance().set_level(LogLevel::INFO);
    }
}

bool Application::setup_vault() {
    GuardResult r = VaultRoot::instance().init(config_.get_string("vault_path", ""));
    if (!r) {
        LOG_ERROR("%s", r.message.c_str());
        return false;
    }
    LOG_DEBUG("Vault root resolved to %s", VaultRoot::instance().path().c_str());
    return true;
}

bool Application::setup_tools() {
    server_.reset(new mcp::McpServer(
        config_.get_string("server.name", AppInfo::DEFAULT_SERVER_NAME),
        config_.get_string("server.version", AppInfo::VERSION)));

    vault_tools_.reset(new VaultToolsProvider(VaultRoot::instance().path()));
    if (!vault_tools_->init(config_)) {
        LOG_ERROR("Failed to initialize %s", vault_tools_->name());
        return false;
    }

    server_->register_provider(*vault_tools_);
    LOG_INFO("Registered %zu tools", server_->tool_count());
    return true;
}

void Application::setup_signals() {
    // The serve loop polls stdin and rechecks its stop flag after every
    // EINTR or timeout.
    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A vanished client must not kill us mid-write.
    signal(SIGPIPE, SIG_IGN);
}

bool Application::init(int argc, char* argv[]) {
    exit_code_ = 0;

    // Parse command line
    if (!parse_args(argc, argv)) {
        return false;
    }

    exit_code_ = 1;
    if (!load_config()) {
        return false;
    }
    setup_logging();

    LOG_DEBUG("%s v%s starting...", AppInfo::NAME, AppInfo::VERSION);

    if (!setup_vault()) {
        return false;
    }
    if (!setup_tools()) {
        return false;
    }

    setup_signals();
    exit_code_ = 0;
    running_ = true;
    return true;
}

int Application::run() {
    LOG_INFO("Obsidian MCP Server running on stdio (using vault path: %s)",
             VaultRoot::instance().path().c_str());

    std::ios::sync_with_stdio(false);
    server_->serve(STDIN_FILENO, std::cout);

    if (!std::cout) {
        LOG_ERROR("Output stream failed");
        return 1;
    }
    return 0;
}

void Application::stop() {
    running_ = false;
    if (server_) {
        server_->stop();
    }
}

void Application::shutdown() {
    LOG_DEBUG("Shutting down...");

    if (vault_tools_) {
        vault_tools_->shutdown();
    }
    server_.reset();
    vault_tools_.reset();
    running_ = false;
}

} // namespace notevault
