#include <chatgate/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <dirent.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

namespace chatgate {

// ============ Time utilities ============

void sleep_ms(int milliseconds) {
    if (milliseconds <= 0) return;
    usleep(static_cast<useconds_t>(milliseconds) * 1000);
}

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp_ms(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[40];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(timestamp_ms % 1000));
    return std::string(out);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(0, end);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    if (prefix.size() > s.size()) return false;
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(s);
    std::string part;
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::string replace_all(const std::string& s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::string result = s;
    size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;
    }
    return s.substr(0, len);
}

std::string slugify(const std::string& s) {
    std::string lowered = to_lower(trim(s));
    std::string result;
    bool pending_dash = false;
    for (size_t i = 0; i < lowered.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(lowered[i]);
        if (std::isalnum(c) || c == '_') {
            if (pending_dash && !result.empty()) result += '-';
            pending_dash = false;
            result += static_cast<char>(c);
        } else {
            pending_dash = true;
        }
    }
    return result;
}

// ============ Recipient utilities ============

std::string digits_only(const std::string& number) {
    std::string result;
    for (size_t i = 0; i < number.size(); ++i) {
        if (std::isdigit(static_cast<unsigned char>(number[i]))) {
            result += number[i];
        }
    }
    size_t first = result.find_first_not_of('0');
    return first == std::string::npos ? std::string() : result.substr(first);
}

std::string normalize_recipient(const std::string& to) {
    std::string trimmed = trim(to);
    if (trimmed.find('@') != std::string::npos) {
        size_t at = trimmed.find('@');
        if (at == 0 || at + 1 >= trimmed.size()) return "";
        return trimmed;
    }
    std::string digits = digits_only(trimmed);
    if (digits.size() < 10 || digits.size() > 15) return "";
    return digits;
}

// ============ Path utilities ============

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a[a.size() - 1] == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) return a + b.substr(1);
    if (!a_ends_slash && !b_starts_slash) return a + "/" + b;
    return a + b;
}

bool path_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool is_directory(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISDIR(st.st_mode);
}

bool mkdir_p(const std::string& path) {
    if (path.empty()) return false;

    std::vector<std::string> parts = split(path, '/');
    std::string current = path[0] == '/' ? "/" : "";

    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty()) continue;
        current = join_path(current, parts[i]);

        if (!path_exists(current)) {
            if (mkdir(current.c_str(), 0700) != 0 && errno != EEXIST) {
                return false;
            }
        } else if (!is_directory(current)) {
            return false;
        }
    }
    return true;
}

bool remove_tree(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) return true;

    if (!S_ISDIR(st.st_mode)) {
        return unlink(path.c_str()) == 0;
    }

    DIR* dir = opendir(path.c_str());
    if (!dir) return false;
    bool ok = true;
    struct dirent* entry;
    while ((entry = readdir(dir)) != NULL) {
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) continue;
        if (!remove_tree(join_path(path, entry->d_name))) ok = false;
    }
    closedir(dir);
    return rmdir(path.c_str()) == 0 && ok;
}

// ============ Encoding utilities ============

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        for (int i = 0; i < 16; ++i) bytes[i] = static_cast<unsigned char>(std::rand() & 0xFF);
    }

    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string hex_encode(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

int64_t base64_decoded_size(const std::string& b64) {
    std::string body = b64;
    // data:image/png;base64,....
    size_t comma = body.find(',');
    if (starts_with(body, "data:") && comma != std::string::npos) {
        body = body.substr(comma + 1);
    }

    int64_t chars = 0;
    int64_t padding = 0;
    for (size_t i = 0; i < body.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(body[i]);
        if (std::isspace(c)) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return -1;
        if (!(std::isalnum(c) || c == '+' || c == '/' || c == '-' || c == '_')) return -1;
        ++chars;
    }
    if (padding > 2) return -1;
    return (chars * 3) / 4;
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace chatgate
