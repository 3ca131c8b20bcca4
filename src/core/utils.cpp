#include <convoflow/core/utils.hpp>
#include <convoflow/core/logger.hpp>
#include <algorithm>
#include <numeric>
#include <cctype>
#include <cstring>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>
#include <openssl/rand.h>

namespace convoflow {

// ============ Time utilities ============

int64_t current_timestamp_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

int64_t monotonic_ms() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

std::string format_timestamp_ms(int64_t timestamp_ms) {
    time_t t = static_cast<time_t>(timestamp_ms / 1000);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return std::string(buf);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\n\r");
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
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
    return std::accumulate(
        std::next(parts.begin()), parts.end(), parts[0],
        [&](const std::string& a, const std::string& b) {
            return a + delimiter + b;
        });
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;

    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;  // back up out of a multi-byte sequence
    }
    return s.substr(0, len);
}

std::string first_line(const std::string& s) {
    size_t nl = s.find('\n');
    if (nl == std::string::npos) return s;
    return s.substr(0, nl);
}

// ============ Path utilities ============

std::string path_basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && (p[p.size() - 1] == '/' || p[p.size() - 1] == '\\')) {
        p.erase(p.size() - 1);
    }
    size_t slash = p.find_last_of("/\\");
    if (slash == std::string::npos) return p;
    return p.substr(slash + 1);
}

bool create_parent_directory(const std::string& filepath) {
    size_t slash = filepath.find_last_of('/');
    if (slash == std::string::npos || slash == 0) return true;

    std::string dir = filepath.substr(0, slash);
    std::string current;
    std::vector<std::string> parts = split(dir, '/');
    if (!dir.empty() && dir[0] == '/') current = "/";

    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].empty()) continue;
        current += parts[i];
        if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
            LOG_ERROR("[Utils] mkdir('%s') failed: %s", current.c_str(), strerror(errno));
            return false;
        }
        current += "/";
    }
    return true;
}

// ============ UUID utilities ============

std::string generate_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        // RAND_bytes only fails when the PRNG cannot be seeded
        LOG_WARN("[Utils] RAND_bytes failed, falling back to time-seeded bytes");
        uint64_t seed = static_cast<uint64_t>(current_timestamp_ms()) ^ static_cast<uint64_t>(getpid());
        for (int i = 0; i < 16; ++i) {
            seed = seed * 6364136223846793005ULL + 1442695040888963407ULL;
            bytes[i] = static_cast<unsigned char>(seed >> 56);
        }
    }

    bytes[6] = (bytes[6] & 0x0F) | 0x40;  // version 4
    bytes[8] = (bytes[8] & 0x3F) | 0x80;  // RFC 4122 variant

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

} // namespace convoflow
