#ifndef halbox_CORE_UTILS_HPP
#define halbox_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace halbox {

// ============ Time utilities ============

// Local time, second resolution (YYYY-MM-DDTHH:MM:SS), used in journals
std::string local_timestamp();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Split into lines, stripping a trailing '\r' from each
std::vector<std::string> split_lines(const std::string& s);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Sanitize a string for safe JSON serialization
// Replaces invalid UTF-8 sequences and problematic control characters
std::string sanitize_utf8(const std::string& s);

// ============ Path utilities ============

// Normalize path (resolve . and ..)
std::string normalize_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Parent directory of a path ("." when there is none)
std::string dirname_of(const std::string& path);

// Expand a leading "~" using $HOME
std::string expand_user(const std::string& path);

// $HOME, falling back to the passwd entry and then /tmp
std::string home_directory();

// Login name of the effective user, falling back to $USER
std::string current_user_name();

// Create a directory and its parents
bool ensure_directory(const std::string& path, unsigned mode = 0700);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// Whole-file read. Returns false if the file can't be opened.
bool read_file(const std::string& path, std::string& out);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Lowercase hex SHA-256 digest
std::string sha256_hex(const std::string& data);

} // namespace halbox

#endif // halbox_CORE_UTILS_HPP
