/*
 * notevault C++17 - Vault Root
 *
 * Resolves the vault directory once at startup to its canonical,
 * symlink-free absolute form. Every later containment check compares
 * against this string, so it must be the real filesystem location and
 * not an alias.
 *
 * The process-wide instance is write-once: init() succeeds a single time
 * and path() throws if read before that.
 */
#ifndef notevault_CORE_VAULT_ROOT_HPP
#define notevault_CORE_VAULT_ROOT_HPP

#include <notevault/core/guard_result.hpp>

#include <string>

namespace notevault {

class VaultRoot {
public:
    // Singleton access
    static VaultRoot& instance();

    // Canonicalize `raw` (relative paths are taken from the current working
    // directory). Fails with GuardError::Config when `raw` is empty, does
    // not exist, or is not a directory. Touches the disk only via stat and
    // realpath.
    static GuardResult resolve(const std::string& raw, std::string& resolved);

    // Resolve and install the root. Fails if already initialized.
    GuardResult init(const std::string& raw);

    bool is_initialized() const { return initialized_; }

    // Throws std::logic_error when called before a successful init().
    const std::string& path() const;

private:
    VaultRoot();
    VaultRoot(const VaultRoot&);
    VaultRoot& operator=(const VaultRoot&);

    bool initialized_;
    std::string path_;
};

} // namespace notevault

#endif // notevault_CORE_VAULT_ROOT_HPP
