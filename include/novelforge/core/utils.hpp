#ifndef novelforge_CORE_UTILS_HPP
#define novelforge_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace novelforge {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int64_t milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds (for deadlines and idle tracking)
int64_t monotonic_ms();

// Format a millisecond timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Decode UTF-8 into code points; malformed bytes become U+FFFD
std::vector<uint32_t> utf8_code_points(const std::string& s);

// ============ Path utilities ============

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Lowercase hex SHA-256 of the input
std::string sha256_hex(const std::string& data);

} // namespace novelforge

#endif // novelforge_CORE_UTILS_HPP
