#include <shotguard/core/utils.hpp>
#include <cctype>
#include <cstdlib>
#include <cstdio>
#include <sys/stat.h>
#include <sys/types.h>
#include <errno.h>

namespace shotguard {

static const char* const kWhitespace = " \t\n\r\f\v";

// ============ Time utilities ============

std::string filename_timestamp() {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    return filename_timestamp(static_cast<int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000);
}

std::string filename_timestamp(int64_t timestamp_ms) {
    time_t secs = static_cast<time_t>(timestamp_ms / 1000);
    struct tm utc;
    gmtime_r(&secs, &utc);

    char buf[40];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d-%02d-%02d-%03dZ",
             utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
             utc.tm_hour, utc.tm_min, utc.tm_sec,
             static_cast<int>(timestamp_ms % 1000));
    return std::string(buf);
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(kWhitespace);
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
    }
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

// Keeps empty fields between adjacent delimiters; a trailing
// delimiter does not produce an empty last field.
std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start < s.size()) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(s.substr(start));
            break;
        }
        fields.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delimiter;
        out += parts[i];
    }
    return out;
}

// ============ Path utilities ============

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;
    const bool absolute = path[0] == '/';

    std::vector<std::string> segments;
    std::vector<std::string> raw = split(path, '/');
    for (size_t i = 0; i < raw.size(); ++i) {
        const std::string& seg = raw[i];
        if (seg.empty() || seg == ".") continue;

        if (seg != "..") {
            segments.push_back(seg);
        } else if (!segments.empty() && segments.back() != "..") {
            segments.pop_back();
        } else if (!absolute) {
            segments.push_back(seg);
        }
        // ".." above the root stays at the root
    }

    std::string out = (absolute ? "/" : "") + join(segments, "/");
    return out.empty() ? "." : out;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;

    std::string head = a[a.size() - 1] == '/' ? a.substr(0, a.size() - 1) : a;
    std::string tail = b[0] == '/' ? b.substr(1) : b;
    return head + "/" + tail;
}

std::string parent_directory(const std::string& path) {
    size_t pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string home_directory() {
    const char* home = getenv("HOME");
    return (home && *home) ? std::string(home) : std::string("/tmp");
}

std::string expand_home(const std::string& path) {
    if (path == "~") return home_directory();
    if (starts_with(path, "~/")) return join_path(home_directory(), path.substr(2));
    return path;
}

bool ensure_directory(const std::string& path) {
    if (path.empty()) return false;

    struct stat st;
    if (stat(path.c_str(), &st) == 0) {
        return S_ISDIR(st.st_mode);
    }

    std::string parent = parent_directory(path);
    if (parent != "/" && parent != "." && !ensure_directory(parent)) {
        return false;
    }
    return mkdir(path.c_str(), 0755) == 0 || errno == EEXIST;
}

bool create_parent_directory(const std::string& filepath) {
    std::string parent = parent_directory(filepath);
    if (parent == "/" || parent == ".") return true;
    return ensure_directory(parent);
}

} // namespace shotguard
