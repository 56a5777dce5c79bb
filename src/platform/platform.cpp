#include "patchguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

#include <fcntl.h>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>

namespace patchguard {

namespace fs = std::filesystem;

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// fsync a file descriptor
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

// fsync a directory by path
bool fsync_directory(const std::string& dir_path) {
    int dir_fd = open(dir_path.c_str(), O_RDONLY);
    if (dir_fd < 0) return false;

    bool result = fsync_fd(dir_fd);
    close(dir_fd);
    return result;
}

// Generate a temporary filename
std::string make_temp_filename(const std::string& base) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string hex_chars = "0123456789abcdef";
    std::string suffix;
    for (int i = 0; i < 8; ++i) {
        suffix += hex_chars[static_cast<size_t>(dis(gen))];
    }

    return base + ".tmp." + suffix;
}

bool valid_calendar_time(int year, int month, int day, int hour, int minute, int second) {
    return year >= 1970 && month >= 1 && month <= 12 && day >= 1 && day <= 31 &&
           hour >= 0 && hour <= 23 && minute >= 0 && minute <= 59 && second >= 0 && second <= 60;
}

std::optional<std::time_t> make_local_time(int year, int month, int day,
                                           int hour, int minute, int second) {
    if (!valid_calendar_time(year, month, day, hour, minute, second)) {
        return std::nullopt;
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    tm_buf.tm_isdst = -1;

    std::time_t t = std::mktime(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return t;
}

} // namespace

// ============================================================================
// Atomic File Operations
// ============================================================================

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;

    // temp + fsync(file) + rename + fsync(dir)
    std::string dir_path = get_parent_directory(path);
    std::string temp_path = make_temp_filename(path);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create temp file: " + std::string(strerror(errno));
        return result;
    }

    ssize_t written = write(fd, content.data(), content.size());
    if (written < 0 || static_cast<size_t>(written) != content.size()) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to write content";
        return result;
    }

    if (!fsync_fd(fd)) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file";
        return result;
    }

    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        unlink(temp_path.c_str());
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        return result;
    }

    if (!dir_path.empty()) {
        fsync_directory(dir_path);
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Path Utilities
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string expand_config_placeholder(const std::string& path, const std::string& build_flavor) {
    static const std::string placeholder = "${config}";

    std::string result;
    size_t start = 0;
    size_t pos;
    while ((pos = path.find(placeholder, start)) != std::string::npos) {
        result += path.substr(start, pos - start);
        result += build_flavor;
        start = pos + placeholder.size();
    }
    result += path.substr(start);
    return result;
}

bool path_matches_any(const std::string& path,
                      const std::vector<std::string>& patterns,
                      const std::string& build_flavor) {
    std::string haystack = to_lower(to_portable_path(path));
    for (const auto& pattern : patterns) {
        if (pattern.empty()) continue;
        std::string needle = to_lower(to_portable_path(expand_config_placeholder(pattern, build_flavor)));
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string make_relative_path(const std::string& path, const std::string& root) {
    if (root.empty()) return path;

    std::string portable_path = to_portable_path(path);
    std::string portable_root = to_portable_path(root);
    while (!portable_root.empty() && portable_root.back() == '/') {
        portable_root.pop_back();
    }

    if (portable_path.compare(0, portable_root.size(), portable_root) != 0) {
        return path;
    }
    if (portable_path.size() > portable_root.size() && portable_path[portable_root.size()] != '/') {
        // Shares a prefix but names a sibling directory
        return path;
    }

    std::string rest = path.substr(portable_root.size());
    while (!rest.empty() && (rest.front() == '/' || rest.front() == '\\')) {
        rest.erase(0, 1);
    }
    return rest;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string get_filename(const std::string& path) {
    fs::path p(path);
    return p.filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= to_portable_path(rel);
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::vector<uint8_t> read_binary_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return {};

    file.seekg(0, std::ios::end);
    auto end = file.tellg();
    if (end < 0) return {};
    size_t size = static_cast<size_t>(end);
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(size);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (!file) return {};

    return data;
}

std::optional<std::time_t> last_write_time(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return st.st_mtime;
}

// ============================================================================
// Time
// ============================================================================

std::optional<std::time_t> parse_library_date(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;

    // ISO form: YYYY-MM-DD[( |T)HH:MM[:SS]]
    if (s.size() >= 10 && s[4] == '-') {
        char sep = 0;
        int n = std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d",
                            &year, &month, &day, &sep, &hour, &minute, &second);
        if (n == 3) {
            return make_local_time(year, month, day, 0, 0, 0);
        }
        if ((n == 6 || n == 7) && (sep == ' ' || sep == 'T')) {
            if (n == 6) second = 0;
            return make_local_time(year, month, day, hour, minute, second);
        }
        return std::nullopt;
    }

    // US short form: M/D/YYYY[ h:mm[:ss][ AM|PM]]
    int n = std::sscanf(s.c_str(), "%d/%d/%d %d:%d:%d",
                        &month, &day, &year, &hour, &minute, &second);
    if (n < 3 || n == 4) return std::nullopt;
    if (n == 3) {
        return make_local_time(year, month, day, 0, 0, 0);
    }
    if (n == 5) second = 0;

    std::string lower = to_lower(s);
    bool pm = lower.size() >= 2 && lower.compare(lower.size() - 2, 2, "pm") == 0;
    bool am = lower.size() >= 2 && lower.compare(lower.size() - 2, 2, "am") == 0;
    if (am || pm) {
        if (hour < 1 || hour > 12) return std::nullopt;
        if (am && hour == 12) hour = 0;
        if (pm && hour != 12) hour += 12;
    }

    return make_local_time(year, month, day, hour, minute, second);
}

std::string format_local_time(std::time_t t) {
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return buf;
}

// ============================================================================
// Environment
// ============================================================================

std::string get_host_name() {
    char buf[256];
    if (gethostname(buf, sizeof(buf)) != 0) {
        return "";
    }
    buf[sizeof(buf) - 1] = '\0';
    return buf;
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Set version 4 (random) and variant bits
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    // WiX component GUIDs are conventionally upper case
    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08X-%04X-%04X-%04X-%012llX",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace patchguard
