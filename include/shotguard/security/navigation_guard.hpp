#ifndef shotguard_SECURITY_NAVIGATION_GUARD_HPP
#define shotguard_SECURITY_NAVIGATION_GUARD_HPP

#include <shotguard/security/address_validator.hpp>
#include <string>

namespace shotguard {

// Per-capture redirect filter. The capture pipeline asks allow() for
// every navigation request (initial load and each redirect hop). The
// already-validated original URL passes untouched; any other URL must
// survive AddressValidator again before it may be followed.
class NavigationGuard {
public:
    NavigationGuard(const std::string& original_url, DnsResolver& resolver);

    bool allow(const std::string& url);

    // Same decision with the reason attached.
    AddressValidationResult check(const std::string& url);

    const std::string& original_url() const { return original_url_; }
    size_t blocked_count() const { return blocked_; }

private:
    std::string original_url_;
    DnsResolver* resolver_;
    size_t blocked_;
};

} // namespace shotguard

#endif // shotguard_SECURITY_NAVIGATION_GUARD_HPP
