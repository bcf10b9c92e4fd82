/*
 * shotguard - Capture Guard Implementation
 */
#include <shotguard/core/capture_guard.hpp>
#include <shotguard/core/config.hpp>
#include <shotguard/core/logger.hpp>
#include <shotguard/core/utils.hpp>

#include <sstream>
#include <utility>

namespace shotguard {

const size_t CaptureGuard::DEFAULT_MAX_CONCURRENT;

// ============================================================================
// CapturePermit
// ============================================================================

std::string CapturePermit::host_resolver_rule() const {
    if (hostname.empty() || pinned_address.empty()) return "";
    AddressValidationResult r = AddressValidationResult::ok(hostname, pinned_address);
    return r.host_resolver_rule();
}

bool CapturePermit::prepare_destination() const {
    if (!create_parent_directory(destination)) {
        LOG_ERROR("[Capture] Cannot create parent directory for %s", destination.c_str());
        return false;
    }
    return true;
}

Json CapturePermit::to_json() const {
    Json j;
    j["destination"] = destination;
    j["gated"] = lease.held();
    if (!url.empty()) j["url"] = url;
    if (!hostname.empty()) j["hostname"] = hostname;
    if (!pinned_address.empty()) {
        j["pinned_address"] = pinned_address;
        j["host_resolver_rule"] = host_resolver_rule();
    }
    return j;
}

// ============================================================================
// CaptureGuard
// ============================================================================

CaptureGuard::CaptureGuard(const AllowListConfig& allow_list, size_t max_concurrent,
                           DnsResolver& dns, RealPathResolver& fs)
    : allow_list_(allow_list)
    , gate_(max_concurrent)
    , dns_(&dns)
    , fs_(&fs)
    , default_dir_ready_(false)
{
    LOG_INFO("[Capture] Guard ready (max concurrent=%zu, default dir=%s)",
             max_concurrent, allow_list_.default_directory.c_str());
    LOG_DEBUG("[Capture] Allowed directories: %s", allow_list_.describe().c_str());
}

CaptureGuard::CaptureGuard(const Config& cfg, DnsResolver& dns, RealPathResolver& fs)
    : CaptureGuard(AllowListConfig::from_config(cfg), configured_capacity(cfg), dns, fs) {}

size_t CaptureGuard::configured_capacity(const Config& cfg) {
    int64_t n = cfg.get_int("capture.max_concurrent", static_cast<int64_t>(DEFAULT_MAX_CONCURRENT));
    if (n < 1) {
        LOG_WARN("[Config] capture.max_concurrent=%lld is invalid, using %zu",
                 static_cast<long long>(n), DEFAULT_MAX_CONCURRENT);
        return DEFAULT_MAX_CONCURRENT;
    }
    return static_cast<size_t>(n);
}

bool CaptureGuard::ensure_default_directory() {
    std::lock_guard<std::mutex> lock(default_dir_mutex_);
    if (default_dir_ready_) return true;

    if (!ensure_directory(allow_list_.default_directory)) {
        LOG_WARN("[Capture] Could not create default directory %s",
                 allow_list_.default_directory.c_str());
        return false;
    }
    default_dir_ready_ = true;
    return true;
}

CapturePreflight CaptureGuard::prepare_web_capture(const std::string& url,
                                                   const std::string& output_path) {
    AddressValidationResult address = AddressValidator::validate(url, *dns_);
    if (!address.valid) {
        return CapturePreflight::refuse("URL validation failed: " + address.error);
    }

    PathValidationResult path = PathValidator::validate(
        output_path, "screenshot-" + filename_timestamp() + ".png", allow_list_, *fs_);
    if (!path.valid) {
        return CapturePreflight::refuse("Output path validation failed: " + path.error);
    }

    // Refuse rather than queue: queued captures would still pile up memory
    GateLease lease = GateLease::try_acquire(gate_);
    if (!lease) {
        std::ostringstream msg;
        msg << "Concurrent screenshot limit reached (max " << gate_.capacity() << "). "
            << "Please wait for existing screenshots to complete.";
        LOG_WARN("[Capture] %s", msg.str().c_str());
        return CapturePreflight::refuse(msg.str());
    }

    CapturePreflight result;
    result.allowed = true;
    result.permit.lease = std::move(lease);
    result.permit.url = url;
    result.permit.hostname = address.hostname;
    result.permit.pinned_address = address.resolved_address;
    result.permit.destination = path.resolved_path;

    LOG_INFO("[Capture] Admitted %s -> %s (pinned %s)",
             url.c_str(), path.resolved_path.c_str(), address.resolved_address.c_str());
    return result;
}

CapturePreflight CaptureGuard::prepare_system_capture(const std::string& output_path,
                                                      const std::string& format) {
    std::string ext = format.empty() ? "png" : to_lower(format);
    if (ext != "png" && ext != "jpg") {
        return CapturePreflight::refuse("Unsupported image format '" + format + "' (expected png or jpg)");
    }

    PathValidationResult path = PathValidator::validate(
        output_path, "system-screenshot-" + filename_timestamp() + "." + ext, allow_list_, *fs_);
    if (!path.valid) {
        return CapturePreflight::refuse("Output path validation failed: " + path.error);
    }

    CapturePreflight result;
    result.allowed = true;
    result.permit.destination = path.resolved_path;
    LOG_DEBUG("[Capture] System capture -> %s", path.resolved_path.c_str());
    return result;
}

Json CaptureGuard::status() const {
    Json j;
    j["capacity"] = gate_.capacity();
    j["available"] = gate_.available();
    j["waiting"] = gate_.waiting();
    j["default_directory"] = allow_list_.default_directory;
    j["allowed_directories"] = allow_list_.allowed_directories;
    return j;
}

} // namespace shotguard
