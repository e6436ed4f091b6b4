#ifndef CHATGATE_CORE_UTILS_HPP
#define CHATGATE_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace chatgate {

// ============ Math utilities ============

template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

void sleep_ms(int milliseconds);

// Wall clock, Unix epoch milliseconds
int64_t current_timestamp_ms();

// ISO 8601 with milliseconds (2026-01-01T12:00:00.000Z)
std::string format_timestamp_ms(int64_t timestamp_ms);

// ============ String utilities ============

std::string trim(const std::string& s);
std::string ltrim(const std::string& s);
std::string rtrim(const std::string& s);
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
std::vector<std::string> split(const std::string& s, char delimiter);
std::string replace_all(const std::string& s, const std::string& from, const std::string& to);

// Truncate without cutting a UTF-8 sequence in half
std::string truncate_safe(const std::string& s, size_t max_len);

// Lowercase; every run of characters outside [a-z0-9_] becomes one '-',
// leading and trailing dashes are dropped. "Support A!" -> "support-a"
std::string slugify(const std::string& s);

// ============ Recipient utilities ============

// Keep digits only and strip leading zeros ("+55 (11) 9999-0000" -> "551199990000")
std::string digits_only(const std::string& number);

// A platform JID ("5511999990000@s.whatsapp.net", "12036302@g.us") is passed
// through; anything else is reduced to digits and must hold 10 to 15 of them.
// Returns an empty string when the recipient cannot be used.
std::string normalize_recipient(const std::string& to);

// ============ Path utilities ============

std::string join_path(const std::string& a, const std::string& b);
bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool mkdir_p(const std::string& path);

// rm -rf; returns true when nothing is left at path
bool remove_tree(const std::string& path);

// ============ Encoding utilities ============

std::string generate_uuid();

std::string hex_encode(const unsigned char* data, size_t len);

// Number of bytes a base64 string decodes to; -1 when the text is not base64
int64_t base64_decoded_size(const std::string& b64);

// Length-independent comparison for secrets
bool constant_time_equals(const std::string& a, const std::string& b);

} // namespace chatgate

#endif // CHATGATE_CORE_UTILS_HPP
