#ifndef shotguard_CORE_UTILS_HPP
#define shotguard_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace shotguard {

// ============ Time utilities ============

// ISO 8601 UTC with milliseconds, ':' and '.' replaced by '-'
// (2026-10-19T08-15-02-123Z). Safe inside a file name.
std::string filename_timestamp();
std::string filename_timestamp(int64_t timestamp_ms);

// ============ String utilities ============

// Strip leading and trailing whitespace
std::string trim(const std::string& s);

std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

std::vector<std::string> split(const std::string& s, char delimiter);

std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Path utilities ============

// Normalize path (resolve . and .., collapse repeated slashes)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Directory part of a path ("/a/b" -> "/a", "/a" -> "/", "a" -> ".")
std::string parent_directory(const std::string& path);

// $HOME, or /tmp when unset
std::string home_directory();

// "~" or "~/x" -> $HOME or $HOME/x; anything else unchanged
std::string expand_home(const std::string& path);

// Create a directory and its parents (mode 0755)
bool ensure_directory(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

} // namespace shotguard

#endif // shotguard_CORE_UTILS_HPP
