#include <shotguard/security/navigation_guard.hpp>
#include <shotguard/core/logger.hpp>

namespace shotguard {

NavigationGuard::NavigationGuard(const std::string& original_url, DnsResolver& resolver)
    : original_url_(original_url)
    , resolver_(&resolver)
    , blocked_(0) {}

AddressValidationResult NavigationGuard::check(const std::string& url) {
    if (url == original_url_) {
        AddressValidationResult r;
        r.valid = true;
        return r;
    }

    AddressValidationResult result = AddressValidator::validate(url, *resolver_);
    if (!result.valid) {
        ++blocked_;
        LOG_WARN("[Navigation] Blocked redirect to %s: %s", url.c_str(), result.error.c_str());
    }
    return result;
}

bool NavigationGuard::allow(const std::string& url) {
    return check(url).valid;
}

} // namespace shotguard
