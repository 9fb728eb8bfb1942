#include <engram/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <openssl/rand.h>

namespace engram {

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
    if (timestamp_ms <= 0) return "never";
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
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

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    if (parts.empty()) return "";
    std::ostringstream oss;
    oss << parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
        oss << delimiter << parts[i];
    }
    return oss.str();
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;
    size_t cut = max_len;
    // Back up over UTF-8 continuation bytes
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return s.substr(0, cut);
}

std::vector<std::string> tokenize_words(const std::string& s) {
    std::vector<std::string> words;
    std::string current;
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(current);
    return words;
}

// ============ Path utilities ============

std::string get_home_dir() {
    const char* home = std::getenv("HOME");
    if (home && home[0]) return std::string(home);
    return "";
}

std::string resolve_user_path(const std::string& path) {
    std::string trimmed = trim(path);
    if (trimmed.empty()) return trimmed;

    if (trimmed[0] == '~') {
        std::string home = get_home_dir();
        if (trimmed.size() == 1) {
            return home;
        }
        if (trimmed[1] == '/') {
            return home + trimmed.substr(1);
        }
    }

    return trimmed;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    bool a_ends_slash = a[a.size() - 1] == '/';
    bool b_starts_slash = b[0] == '/';

    if (a_ends_slash && b_starts_slash) {
        return a + b.substr(1);
    }
    if (!a_ends_slash && !b_starts_slash) {
        return a + "/" + b;
    }
    return a + b;
}

std::string dirname(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
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
    std::string current;

    if (path[0] == '/') {
        current = "/";
    }

    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty()) continue;
        current = join_path(current, parts[i]);

        if (!path_exists(current)) {
            if (mkdir(current.c_str(), 0755) != 0) {
                return false;
            }
        } else if (!is_directory(current)) {
            return false;
        }
    }

    return true;
}

// ============ ID utilities ============

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, 16) != 1) {
        // Entropy pool failure; fall back to a time-seeded source
        srand(static_cast<unsigned>(current_timestamp_ms()) ^ static_cast<unsigned>(getpid()));
        for (int i = 0; i < 16; ++i) bytes[i] = static_cast<unsigned char>(rand() & 0xFF);
    }

    // Version 4, RFC 4122 variant
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }

    return oss.str();
}

std::string generate_short_id() {
    return generate_uuid().substr(0, 8);
}

std::string short_id(const std::string& id) {
    return id.size() > 8 ? id.substr(0, 8) : id;
}

} // namespace engram
