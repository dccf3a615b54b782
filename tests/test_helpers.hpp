/*
 * notevault C++17 - Test helpers
 *
 * Temporary vault directories plus small POSIX helpers to populate them.
 */
#ifndef notevault_TESTS_TEST_HELPERS_HPP
#define notevault_TESTS_TEST_HELPERS_HPP

#include <notevault/core/utils.hpp>

#include <gtest/gtest.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <sys/time.h>
#include <unistd.h>
#include <vector>

namespace notevault {
namespace testutil {

// Recursively delete `path` without following symlinks.
inline void remove_tree(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) return;

    if (S_ISDIR(st.st_mode)) {
        DIR* dir = opendir(path.c_str());
        if (dir) {
            struct dirent* entry;
            while ((entry = readdir(dir)) != nullptr) {
                std::string name = entry->d_name;
                if (name == "." || name == "..") continue;
                remove_tree(path + "/" + name);
            }
            closedir(dir);
        }
        rmdir(path.c_str());
    } else {
        unlink(path.c_str());
    }
}

// mkdtemp directory, canonicalized with realpath, removed on destruction.
class TempVault {
public:
    TempVault() {
        const char* tmp = getenv("TMPDIR");
        std::string tmpl = std::string(tmp && tmp[0] ? tmp : "/tmp") + "/vault-test-XXXXXX";
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error(std::string("mkdtemp: ") + strerror(errno));
        }
        char real[PATH_MAX];
        if (!realpath(buf.data(), real)) {
            throw std::runtime_error(std::string("realpath: ") + strerror(errno));
        }
        path_ = real;
    }

    ~TempVault() { remove_tree(path_); }

    const std::string& path() const { return path_; }
    std::string abs(const std::string& rel) const { return path_ + "/" + rel; }

private:
    TempVault(const TempVault&);
    TempVault& operator=(const TempVault&);

    std::string path_;
};

inline void make_dirs(const std::string& abs_dir) {
    std::vector<std::string> parts = split(abs_dir, '/');
    std::string current;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty()) continue;
        current += "/" + parts[i];
        mkdir(current.c_str(), 0755);
    }
}

// Write `content` to root/rel, creating parents. Returns the absolute path.
inline std::string create_file(const std::string& root, const std::string& rel,
                               const std::string& content) {
    std::string full = root + "/" + rel;
    make_dirs(parent_path(full));
    std::ofstream out(full.c_str(), std::ios::binary | std::ios::trunc);
    out << content;
    out.close();
    if (!out) {
        throw std::runtime_error("cannot write " + full);
    }
    return full;
}

// Create a symlink at root/link_rel pointing to `target`.
inline std::string create_symlink(const std::string& root, const std::string& link_rel,
                                  const std::string& target) {
    std::string full = root + "/" + link_rel;
    make_dirs(parent_path(full));
    if (symlink(target.c_str(), full.c_str()) != 0) {
        throw std::runtime_error("symlink " + full + ": " + strerror(errno));
    }
    return full;
}

// Set both atime and mtime to `seconds` since the epoch, without
// following symlinks.
inline void set_mtime(const std::string& full, time_t seconds) {
    struct timespec times[2];
    times[0].tv_sec = seconds;
    times[0].tv_nsec = 0;
    times[1].tv_sec = seconds;
    times[1].tv_nsec = 0;
    if (utimensat(AT_FDCWD, full.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        throw std::runtime_error("utimensat " + full + ": " + strerror(errno));
    }
}

inline std::string read_file(const std::string& full) {
    std::ifstream in(full.c_str(), std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline bool path_exists(const std::string& full) {
    struct stat st;
    return lstat(full.c_str(), &st) == 0;
}

inline bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace testutil
} // namespace notevault

#endif // notevault_TESTS_TEST_HELPERS_HPP
