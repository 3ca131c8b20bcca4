#ifndef convoflow_CORE_UTILS_HPP
#define convoflow_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace convoflow {

// ============ Math utilities ============

template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Monotonic clock in milliseconds (for intervals, never for timestamps)
int64_t monotonic_ms();

// Format a millisecond timestamp as ISO 8601 (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);

std::string to_lower(const std::string& s);

std::vector<std::string> split(const std::string& s, char delimiter);

std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// First line of a string (up to the first '\n')
std::string first_line(const std::string& s);


// ============ Path utilities ============

// Last path component ("src/auth.rs" -> "auth.rs")
std::string path_basename(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// ============ UUID utilities ============

// Random UUID v4 (OpenSSL RAND_bytes)
std::string generate_uuid();

} // namespace convoflow

#endif // convoflow_CORE_UTILS_HPP
