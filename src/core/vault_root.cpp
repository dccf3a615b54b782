/*
 * notevault C++17 - Vault Root Implementation
 */
#include <notevault/core/vault_root.hpp>
#include <notevault/core/logger.hpp>
#include <notevault/core/utils.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace notevault {

VaultRoot& VaultRoot::instance() {
    static VaultRoot root;
    return root;
}

VaultRoot::VaultRoot()
    : initialized_(false) {}

GuardResult VaultRoot::resolve(const std::string& raw, std::string& resolved) {
    if (raw.empty()) {
        return GuardResult::fail(GuardError::Config,
            "Vault path must be provided as a command line argument.\n"
            "Usage: notevault [options] <vault_path>");
    }

    std::string absolute = raw;
    if (raw[0] != '/') {
        char cwd[PATH_MAX];
        if (!getcwd(cwd, sizeof(cwd))) {
            return GuardResult::fail(GuardError::Config,
                "Invalid vault path: \"" + raw + "\" (cannot determine working directory: " +
                strerror(errno) + ")");
        }
        absolute = join_path(cwd, raw);
    }
    absolute = normalize_path(absolute);

    struct stat st;
    if (stat(absolute.c_str(), &st) != 0) {
        return GuardResult::fail(GuardError::Config,
            "Invalid vault path: \"" + raw + "\" (path does not exist)\n"
            "Please provide a path to an existing Obsidian vault");
    }
    if (!S_ISDIR(st.st_mode)) {
        return GuardResult::fail(GuardError::Config,
            "Invalid vault path: \"" + raw + "\" (path must be a directory, not a file)");
    }

    char real[PATH_MAX];
    if (!realpath(absolute.c_str(), real)) {
        return GuardResult::fail(GuardError::Config,
            "Invalid vault path: \"" + raw + "\" (cannot be resolved: " + strerror(errno) + ")");
    }

    resolved = real;
    return GuardResult::ok();
}

GuardResult VaultRoot::init(const std::string& raw) {
    if (initialized_) {
        return GuardResult::fail(GuardError::Config, "Vault path is already configured.");
    }

    std::string resolved;
    GuardResult result = resolve(raw, resolved);
    if (!result) {
        return result;
    }

    path_ = resolved;
    initialized_ = true;
    LOG_INFO("[Vault] Root resolved: %s", path_.c_str());
    return result;
}

const std::string& VaultRoot::path() const {
    if (!initialized_) {
        throw std::logic_error("Vault path is not configured.");
    }
    return path_;
}

} // namespace notevault
