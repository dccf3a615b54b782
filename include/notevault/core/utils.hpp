#ifndef notevault_CORE_UTILS_HPP
#define notevault_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace notevault {

// ============ Time utilities ============

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// Format timestamp as a UTC calendar date (YYYY-MM-DD)
std::string format_date(int64_t timestamp);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase (ASCII only)
std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split string by delimiter. Keeps empty fields, including a trailing one.
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Path utilities ============

// Normalize path lexically (resolve . and .. without touching the disk)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Final path component ("notes/a.md" -> "a.md")
std::string base_name(const std::string& path);

// Everything before the final component ("/v/notes/a.md" -> "/v/notes").
// Returns "" when there is no '/'.
std::string parent_path(const std::string& path);

} // namespace notevault

#endif // notevault_CORE_UTILS_HPP
