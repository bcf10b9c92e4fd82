/*
 * shotguard - preflight checker for the screenshot tool
 *
 * Usage:
 *   ./shotguard [--config config.json] url <URL>
 *   ./shotguard [--config config.json] path <PATH> [png|jpg]
 *   ./shotguard [--config config.json] preflight <URL> [PATH]
 *   ./shotguard [--config config.json] status
 *
 * Prints the decision as JSON. Exit status: 0 allowed, 1 refused,
 * 2 usage or configuration error.
 */
#include <shotguard/core/capture_guard.hpp>
#include <shotguard/core/config.hpp>
#include <shotguard/core/logger.hpp>
#include <shotguard/core/utils.hpp>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace {

const char* const APP_NAME = "shotguard";
const char* const APP_VERSION = "1.0.0";

void print_usage(const char* prog) {
    std::cout << APP_NAME << " - SSRF, output path and concurrency preflight\n\n"
              << "Usage: " << prog << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  url <URL>               Validate a capture URL and show the pinned address\n"
              << "  path <PATH> [png|jpg]   Validate an output path (empty PATH = default)\n"
              << "  preflight <URL> [PATH]  Full web-capture preflight\n"
              << "  status                  Show gate capacity and allowed directories\n\n"
              << "Options:\n"
              << "  --config FILE  Load configuration from FILE\n"
              << "  --verbose      Debug logging\n"
              << "  -h, --help     Show this help message\n"
              << "  -v, --version  Show version\n";
}

void print_version() {
    std::cout << APP_NAME << " v" << APP_VERSION << "\n";
}

struct Options {
    std::string config_file;
    bool verbose;
    std::vector<std::string> args;

    Options() : verbose(false) {}
};

// Returns -1 to continue, otherwise the exit status.
int parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            return 0;
        }
        if (strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "--config needs a file argument\n";
                return 2;
            }
            opts.config_file = argv[++i];
            continue;
        }
        if (strcmp(argv[i], "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }
        opts.args.push_back(argv[i]);
    }

    if (opts.args.empty()) {
        print_usage(argv[0]);
        return 2;
    }
    return -1;
}

void setup_logging(const shotguard::Config& cfg, bool verbose) {
    shotguard::LogLevel level = shotguard::LogLevel::WARN;
    std::string name = cfg.get_string("log_level", "");
    if (!name.empty() && !shotguard::parse_log_level(name, level)) {
        LOG_WARN("Unknown log_level '%s', keeping warn", name.c_str());
    }
    if (verbose) {
        level = shotguard::LogLevel::DEBUG;
    }
    shotguard::Logger::instance().set_level(level);
}

int emit(const shotguard::Json& j, bool allowed) {
    std::cout << j.dump(2) << std::endl;
    return allowed ? 0 : 1;
}

int run(const Options& opts, const shotguard::Config& cfg) {
    using namespace shotguard;

    const std::string& command = opts.args[0];
    const std::string arg1 = opts.args.size() > 1 ? opts.args[1] : "";
    const std::string arg2 = opts.args.size() > 2 ? opts.args[2] : "";

    SystemDnsResolver dns;
    SystemRealPathResolver fs;

    if (command == "url") {
        if (arg1.empty()) {
            std::cerr << "url: missing URL\n";
            return 2;
        }
        AddressValidationResult r = AddressValidator::validate(arg1, dns);
        Json j = r.to_json();
        if (r.valid) j["host_resolver_rule"] = r.host_resolver_rule();
        return emit(j, r.valid);
    }

    CaptureGuard guard(cfg, dns, fs);

    if (command == "path") {
        CapturePreflight p = guard.prepare_system_capture(arg1, arg2);
        Json j;
        j["valid"] = p.allowed;
        if (p.allowed) {
            j["resolved_path"] = p.permit.destination;
        } else {
            j["error"] = p.error;
        }
        return emit(j, p.allowed);
    }

    if (command == "preflight") {
        if (arg1.empty()) {
            std::cerr << "preflight: missing URL\n";
            return 2;
        }
        CapturePreflight p = guard.prepare_web_capture(arg1, arg2);
        Json j;
        j["allowed"] = p.allowed;
        if (p.allowed) {
            j["permit"] = p.permit.to_json();
        } else {
            j["error"] = p.error;
        }
        return emit(j, p.allowed);
    }

    if (command == "status") {
        return emit(guard.status(), true);
    }

    std::cerr << "Unknown command: " << command << "\n";
    return 2;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    int rc = parse_args(argc, argv, opts);
    if (rc >= 0) {
        return rc;
    }

    shotguard::Config cfg;
    if (!opts.config_file.empty() && !cfg.load_file(opts.config_file)) {
        return 2;
    }
    setup_logging(cfg, opts.verbose);

    curl_global_init(CURL_GLOBAL_DEFAULT);
    rc = run(opts, cfg);
    curl_global_cleanup();

    return rc;
}
