/*
 * shotguard - DNS resolution capability
 *
 * AddressValidator never calls the system resolver directly; it is handed
 * a DnsResolver so tests can substitute canned answers.
 */
#ifndef shotguard_SECURITY_DNS_RESOLVER_HPP
#define shotguard_SECURITY_DNS_RESOLVER_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace shotguard {

enum class AddressFamily {
    IPv4 = 4,
    IPv6 = 6
};

struct ResolvedAddress {
    std::string address;
    AddressFamily family;

    ResolvedAddress() : family(AddressFamily::IPv4) {}
    ResolvedAddress(const std::string& a, AddressFamily f) : address(a), family(f) {}

    bool operator==(const ResolvedAddress& other) const {
        return address == other.address && family == other.family;
    }
};

// Thrown by resolvers on NXDOMAIN, timeout or any other lookup failure.
class DnsResolutionError : public std::runtime_error {
public:
    explicit DnsResolutionError(const std::string& what) : std::runtime_error(what) {}
};

class DnsResolver {
public:
    virtual ~DnsResolver() {}

    // Every A and AAAA answer for `hostname`, in answer order.
    virtual std::vector<ResolvedAddress> lookup(const std::string& hostname) = 0;
};

// getaddrinfo(AF_UNSPEC) backed resolver.
class SystemDnsResolver : public DnsResolver {
public:
    std::vector<ResolvedAddress> lookup(const std::string& hostname) override;
};

} // namespace shotguard

#endif // shotguard_SECURITY_DNS_RESOLVER_HPP
