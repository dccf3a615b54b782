/*
 * notevault C++17 - Guarded Writer
 *
 * The only code path that modifies the vault. Order of operations:
 *
 *   validate_write_path -> content ceiling -> create/update lookup
 *     -> ensure_parent_directories -> assert_no_symlinked_ancestors
 *     -> open(O_NOFOLLOW) -> write -> verify_same_file -> close
 */
#ifndef notevault_CORE_FILE_WRITER_HPP
#define notevault_CORE_FILE_WRITER_HPP

#include <notevault/core/guard_result.hpp>

#include <string>

namespace notevault {

enum class WriteOutcome {
    Created,
    Updated
};

GuardResult write_file(const std::string& root,
                       const std::string& relative_path,
                       const std::string& content,
                       WriteOutcome& outcome);

} // namespace notevault

#endif // notevault_CORE_FILE_WRITER_HPP
