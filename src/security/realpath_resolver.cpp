#include <shotguard/security/realpath_resolver.hpp>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <sys/stat.h>

namespace shotguard {

std::string SystemRealPathResolver::realpath(const std::string& path) {
    char resolved[PATH_MAX];
    const char* rp = ::realpath(path.c_str(), resolved);
    if (!rp) {
        int err = errno;
        throw PathResolutionError(std::string(strerror(err)) + ", realpath '" + path + "'", err);
    }
    return std::string(rp);
}

bool SystemRealPathResolver::is_symlink(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) return false;
    return S_ISLNK(st.st_mode);
}

} // namespace shotguard
