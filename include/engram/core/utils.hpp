#ifndef ENGRAM_CORE_UTILS_HPP
#define ENGRAM_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace engram {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format a millisecond timestamp as local "YYYY-MM-DD HH:MM:SS"
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);

std::string to_lower(const std::string& s);

std::vector<std::string> split(const std::string& s, char delimiter);

std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Lowercase alphanumeric words of a text
std::vector<std::string> tokenize_words(const std::string& s);

// ============ Path utilities ============

// Resolve ~ to home directory
std::string resolve_user_path(const std::string& path);

std::string get_home_dir();

std::string join_path(const std::string& a, const std::string& b);

std::string dirname(const std::string& path);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

// Create directory (and parents if needed)
bool mkdir_p(const std::string& path);

// ============ ID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// 8 hex characters, used for queue request ids
std::string generate_short_id();

// First 8 characters of an id, for display
std::string short_id(const std::string& id);

} // namespace engram

#endif // ENGRAM_CORE_UTILS_HPP
