#ifndef shotguard_SECURITY_REALPATH_RESOLVER_HPP
#define shotguard_SECURITY_REALPATH_RESOLVER_HPP

#include <stdexcept>
#include <string>

namespace shotguard {

// Thrown when a path cannot be canonicalized (ENOENT, EACCES, ENOTDIR, ...).
class PathResolutionError : public std::runtime_error {
public:
    PathResolutionError(const std::string& what, int err)
        : std::runtime_error(what), errno_(err) {}

    int error_number() const { return errno_; }

private:
    int errno_;
};

class RealPathResolver {
public:
    virtual ~RealPathResolver() {}

    // Canonical absolute form of `path` with every symlink resolved.
    // The path must exist.
    virtual std::string realpath(const std::string& path) = 0;

    // True if `path` itself is a symbolic link (dangling or not).
    // PathValidator relies on it to refuse dangling links.
    virtual bool is_symlink(const std::string& path) = 0;
};

// realpath(3) / lstat(2) backed resolver.
class SystemRealPathResolver : public RealPathResolver {
public:
    std::string realpath(const std::string& path) override;
    bool is_symlink(const std::string& path) override;
};

} // namespace shotguard

#endif // shotguard_SECURITY_REALPATH_RESOLVER_HPP
