/*
 * shotguard - Output Path Validator (path traversal / symlink TOCTOU)
 *
 * A requested output path is accepted only if, after every symlink on
 * the way has been resolved, it lands inside one of the allowed
 * directories (themselves symlink-resolved). The returned resolved_path
 * is the only path the caller may write to.
 */
#ifndef shotguard_SECURITY_PATH_VALIDATOR_HPP
#define shotguard_SECURITY_PATH_VALIDATOR_HPP

#include <shotguard/core/json.hpp>
#include <shotguard/security/realpath_resolver.hpp>
#include <string>
#include <vector>

namespace shotguard {

class Config;

// The universe of writable locations. Read-only once built.
struct AllowListConfig {
    std::vector<std::string> allowed_directories;   // ordered, absolute
    std::string default_directory;                  // absolute

    // ~/Desktop/Screenshots (default), /tmp, ~/Downloads, ~/Documents
    static AllowListConfig defaults();

    // output.default_dir / output.allowed_dirs, falling back to defaults().
    // "~/" prefixes are expanded; relative entries are dropped.
    static AllowListConfig from_config(const Config& cfg);

    // "a, b, c"
    std::string describe() const;
};

struct PathValidationResult {
    bool valid;
    std::string resolved_path;
    std::string error;

    PathValidationResult() : valid(false) {}

    static PathValidationResult ok(const std::string& path) {
        PathValidationResult r;
        r.valid = true;
        r.resolved_path = path;
        return r;
    }

    static PathValidationResult fail(const std::string& err) {
        PathValidationResult r;
        r.error = err;
        return r;
    }

    Json to_json() const;

    bool operator==(const PathValidationResult& other) const {
        return valid == other.valid && resolved_path == other.resolved_path && error == other.error;
    }
};

class PathValidator {
public:
    // custom_path empty or blank selects default_directory/default_file_name.
    static PathValidationResult validate(const std::string& custom_path,
                                         const std::string& default_file_name,
                                         const AllowListConfig& config,
                                         RealPathResolver& resolver);

    // Uses SystemRealPathResolver.
    static PathValidationResult validate(const std::string& custom_path,
                                         const std::string& default_file_name,
                                         const AllowListConfig& config);

    // `path` equals `dir` or lies beneath it. Both must be normalized.
    static bool is_within(const std::string& path, const std::string& dir);

private:
    static bool resolve_target(const std::string& target, RealPathResolver& resolver,
                               std::string& real_path, std::string& error);
};

} // namespace shotguard

#endif // shotguard_SECURITY_PATH_VALIDATOR_HPP
