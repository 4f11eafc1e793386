#ifndef agentmem_CORE_UTILS_HPP
#define agentmem_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace agentmem {

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase (ASCII only, same as SQLite's lower())
std::string to_lower(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Directory part of a path ("" when there is none)
std::string parent_path(const std::string& path);

// Create a directory and all missing parents
bool create_directories(const std::string& dir);

// ============ UUID utilities ============

// Generate a random UUID v4 (canonical hyphenated lowercase form) from the
// OpenSSL CSPRNG; throws StoreError if it cannot supply bytes
std::string generate_uuid();

} // namespace agentmem

#endif // agentmem_CORE_UTILS_HPP
