/*
 * shotguard - Output Path Validator Implementation
 */
#include <shotguard/security/path_validator.hpp>
#include <shotguard/core/config.hpp>
#include <shotguard/core/logger.hpp>
#include <shotguard/core/utils.hpp>

namespace shotguard {

// ============================================================================
// AllowListConfig
// ============================================================================

AllowListConfig AllowListConfig::defaults() {
    std::string home = home_directory();

    AllowListConfig cfg;
    cfg.default_directory = join_path(home, "Desktop/Screenshots");
    cfg.allowed_directories.push_back(cfg.default_directory);
    cfg.allowed_directories.push_back("/tmp");
    cfg.allowed_directories.push_back(join_path(home, "Downloads"));
    cfg.allowed_directories.push_back(join_path(home, "Documents"));
    return cfg;
}

AllowListConfig AllowListConfig::from_config(const Config& cfg) {
    AllowListConfig result = defaults();

    std::string default_dir = normalize_path(expand_home(cfg.get_string("output.default_dir", "")));
    if (starts_with(default_dir, "/")) {
        result.default_directory = default_dir;
    } else if (cfg.has("output.default_dir")) {
        LOG_WARN("[Config] output.default_dir must be absolute, using %s",
                 result.default_directory.c_str());
    }

    if (cfg.has("output.allowed_dirs")) {
        std::vector<std::string> dirs = cfg.get_string_array("output.allowed_dirs",
                                                             std::vector<std::string>());
        std::vector<std::string> accepted;
        for (size_t i = 0; i < dirs.size(); ++i) {
            std::string dir = normalize_path(expand_home(dirs[i]));
            if (!starts_with(dir, "/")) {
                LOG_WARN("[Config] Ignoring relative allowed directory '%s'", dirs[i].c_str());
                continue;
            }
            accepted.push_back(dir);
        }
        if (accepted.empty()) {
            LOG_WARN("[Config] output.allowed_dirs has no usable entries, keeping defaults");
        } else {
            result.allowed_directories = accepted;
        }
    } else if (result.default_directory != defaults().default_directory) {
        // A relocated default directory must stay writable
        result.allowed_directories[0] = result.default_directory;
    }

    // Empty custom paths land in the default directory unchecked, so it
    // has to be inside the allow-list.
    bool covered = false;
    for (size_t i = 0; i < result.allowed_directories.size() && !covered; ++i) {
        covered = PathValidator::is_within(result.default_directory, result.allowed_directories[i]);
    }
    if (!covered) {
        LOG_WARN("[Config] output.default_dir %s is outside output.allowed_dirs, allowing it",
                 result.default_directory.c_str());
        result.allowed_directories.push_back(result.default_directory);
    }

    return result;
}

std::string AllowListConfig::describe() const {
    return join(allowed_directories, ", ");
}

Json PathValidationResult::to_json() const {
    Json j;
    j["valid"] = valid;
    if (!resolved_path.empty()) j["resolved_path"] = resolved_path;
    if (!error.empty()) j["error"] = error;
    return j;
}

// ============================================================================
// PathValidator
// ============================================================================

bool PathValidator::is_within(const std::string& path, const std::string& dir) {
    if (dir == "/") return starts_with(path, "/");
    if (path == dir) return true;
    return path.size() > dir.size() &&
           path.compare(0, dir.size(), dir) == 0 &&
           path[dir.size()] == '/';
}

PathValidationResult PathValidator::validate(const std::string& custom_path,
                                             const std::string& default_file_name,
                                             const AllowListConfig& config) {
    SystemRealPathResolver resolver;
    return validate(custom_path, default_file_name, config, resolver);
}

PathValidationResult PathValidator::validate(const std::string& custom_path,
                                             const std::string& default_file_name,
                                             const AllowListConfig& config,
                                             RealPathResolver& resolver) {
    if (trim(custom_path).empty()) {
        return PathValidationResult::ok(
            normalize_path(join_path(config.default_directory, default_file_name)));
    }

    if (custom_path.find('\0') != std::string::npos ||
        custom_path.find("%00") != std::string::npos) {
        LOG_WARN("[PathValidator] Rejected path containing a null byte");
        return PathValidationResult::fail("Path contains null bytes");
    }

    // Relative paths are anchored at the default directory, never the cwd
    std::string target = starts_with(custom_path, "/")
        ? normalize_path(custom_path)
        : normalize_path(join_path(config.default_directory, custom_path));

    std::string real_path;
    std::string error;
    if (!resolve_target(target, resolver, real_path, error)) {
        LOG_WARN("[PathValidator] %s: %s", target.c_str(), error.c_str());
        return PathValidationResult::fail(error);
    }

    for (size_t i = 0; i < config.allowed_directories.size(); ++i) {
        const std::string& allowed = config.allowed_directories[i];
        std::string real_allowed;
        try {
            real_allowed = resolver.realpath(allowed);
        } catch (const std::exception&) {
            // Not created yet; compare against its literal form
            real_allowed = normalize_path(allowed);
        }

        if (is_within(real_path, real_allowed)) {
            LOG_DEBUG("[PathValidator] %s -> %s (inside %s)",
                      custom_path.c_str(), real_path.c_str(), real_allowed.c_str());
            return PathValidationResult::ok(real_path);
        }
    }

    LOG_WARN("[PathValidator] %s resolves to %s, outside every allowed directory",
             custom_path.c_str(), real_path.c_str());
    return PathValidationResult::fail(
        "Output path must be within allowed directories (" + config.describe() +
        "). Symlinks to other locations are not permitted.");
}

bool PathValidator::resolve_target(const std::string& target, RealPathResolver& resolver,
                                   std::string& real_path, std::string& error) {
    try {
        real_path = resolver.realpath(target);
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("[PathValidator] %s not resolvable (%s), trying parent", target.c_str(), e.what());
    }

    // A link whose target is missing would be followed by the eventual
    // write; resolving only its parent would hide where it points.
    if (resolver.is_symlink(target)) {
        error = "Output path is a symlink whose target does not exist: " + target;
        return false;
    }

    std::string parent = parent_directory(target);
    if (parent == target) {
        error = "Parent directory does not exist: " + parent;
        return false;
    }
    std::string file_name = target.substr(parent == "/" ? 1 : parent.size() + 1);

    try {
        real_path = join_path(resolver.realpath(parent), file_name);
    } catch (const std::exception&) {
        error = "Parent directory does not exist: " + parent;
        return false;
    }
    return true;
}

} // namespace shotguard
