/*
 * shotguard - Capture Guard
 *
 * Preflight for the screenshot tool. Runs the checks in the required
 * order before anything expensive happens:
 *
 *   web capture:    URL -> output path -> gate (non-blocking)
 *   system capture: output path only (local tools are cheap, no gate)
 *
 * A successful preflight yields a CapturePermit. For web captures the
 * permit owns the gate unit; dropping the permit releases it, whatever
 * way the capture ends.
 */
#ifndef shotguard_CORE_CAPTURE_GUARD_HPP
#define shotguard_CORE_CAPTURE_GUARD_HPP

#include <shotguard/core/concurrency_gate.hpp>
#include <shotguard/core/json.hpp>
#include <shotguard/security/address_validator.hpp>
#include <shotguard/security/navigation_guard.hpp>
#include <shotguard/security/path_validator.hpp>
#include <mutex>
#include <string>

namespace shotguard {

class Config;

struct CapturePermit {
    GateLease lease;                // empty for system captures
    std::string url;
    std::string hostname;
    std::string pinned_address;
    std::string destination;        // resolved path, the only one to write to

    // --host-resolver-rules value for the headless browser
    std::string host_resolver_rule() const;

    // Create the destination's parent directory.
    bool prepare_destination() const;

    Json to_json() const;
};

struct CapturePreflight {
    bool allowed;
    std::string error;
    CapturePermit permit;

    CapturePreflight() : allowed(false) {}

    static CapturePreflight refuse(const std::string& err) {
        CapturePreflight p;
        p.error = err;
        return p;
    }
};

class CaptureGuard {
public:
    static const size_t DEFAULT_MAX_CONCURRENT = 3;

    CaptureGuard(const AllowListConfig& allow_list, size_t max_concurrent,
                 DnsResolver& dns, RealPathResolver& fs);

    // capture.max_concurrent, output.default_dir, output.allowed_dirs
    CaptureGuard(const Config& cfg, DnsResolver& dns, RealPathResolver& fs);

    CapturePreflight prepare_web_capture(const std::string& url, const std::string& output_path);

    // format: "png" (default when empty) or "jpg"
    CapturePreflight prepare_system_capture(const std::string& output_path, const std::string& format);

    // Redirect filter for a capture already admitted by prepare_web_capture.
    NavigationGuard navigation_guard(const std::string& url) { return NavigationGuard(url, *dns_); }

    // mkdir -p on the default directory, once per guard.
    bool ensure_default_directory();

    ConcurrencyGate& gate() { return gate_; }
    const AllowListConfig& allow_list() const { return allow_list_; }

    Json status() const;

private:
    CaptureGuard(const CaptureGuard&);
    CaptureGuard& operator=(const CaptureGuard&);

    static size_t configured_capacity(const Config& cfg);

    AllowListConfig allow_list_;
    ConcurrencyGate gate_;
    DnsResolver* dns_;
    RealPathResolver* fs_;

    std::mutex default_dir_mutex_;
    bool default_dir_ready_;
};

} // namespace shotguard

#endif // shotguard_CORE_CAPTURE_GUARD_HPP
