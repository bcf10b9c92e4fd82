/*
 * shotguard - Address Validator Implementation
 *
 * URL parsing is delegated to the libcurl URL API so the host we check is
 * the host libcurl (and any other WHATWG-ish client) will connect to.
 */
#include <shotguard/security/address_validator.hpp>
#include <shotguard/core/logger.hpp>
#include <shotguard/core/utils.hpp>

#include <cctype>
#include <cstring>
#include <memory>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <curl/curl.h>

namespace shotguard {

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* h) const { curl_url_cleanup(h); }
};
typedef std::unique_ptr<CURLU, CurlUrlDeleter> CurlUrlPtr;

bool get_url_part(CURLU* h, CURLUPart part, std::string& out) {
    char* value = nullptr;
    if (curl_url_get(h, part, &value, 0) != CURLUE_OK || value == nullptr) {
        return false;
    }
    out = value;
    curl_free(value);
    return true;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Parse exactly 1-4 hex digits.
bool parse_hex_group(const std::string& s, unsigned& out) {
    if (s.empty() || s.size() > 4) return false;
    unsigned v = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        int h = hex_value(s[i]);
        if (h < 0) return false;
        v = (v << 4) | static_cast<unsigned>(h);
    }
    out = v;
    return true;
}

bool is_ipv6_address(const std::string& ip) {
    struct in6_addr addr;
    return inet_pton(AF_INET6, ip.c_str(), &addr) == 1;
}

std::string canonical_ipv6(const std::string& ip) {
    struct in6_addr addr;
    if (inet_pton(AF_INET6, ip.c_str(), &addr) != 1) {
        return ip;
    }
    char buf[INET6_ADDRSTRLEN];
    if (!inet_ntop(AF_INET6, &addr, buf, sizeof(buf))) {
        return ip;
    }
    return std::string(buf);
}

BlockDecision mapped_ipv4_decision(const BlockDecision& inner) {
    if (!inner.blocked) return inner;
    return BlockDecision::block("Access to IPv4-mapped blocked address: " + inner.reason);
}

// Resolver answers must be well-formed for their family; anything else
// is refused rather than guessed at.
BlockDecision classify_resolved(const ResolvedAddress& addr) {
    if (addr.family == AddressFamily::IPv4) {
        uint8_t o[4];
        if (!parse_ipv4(addr.address, o)) {
            return BlockDecision::block("Unrecognized IPv4 address: " + addr.address);
        }
        return classify_ipv4(o[0], o[1], o[2], o[3]);
    }
    if (!is_ipv6_address(addr.address)) {
        return BlockDecision::block("Unrecognized IPv6 address: " + addr.address);
    }
    return classify_ipv6(addr.address);
}

} // namespace

// ============================================================================
// Range classification
// ============================================================================

bool parse_ipv4(const std::string& ip, uint8_t octets[4]) {
    std::vector<std::string> parts = split(ip, '.');
    if (parts.size() != 4 || ip.empty() || ip.back() == '.') return false;

    for (size_t i = 0; i < 4; ++i) {
        const std::string& p = parts[i];
        if (p.empty() || p.size() > 3) return false;
        unsigned v = 0;
        for (size_t j = 0; j < p.size(); ++j) {
            if (!isdigit(static_cast<unsigned char>(p[j]))) return false;
            v = v * 10 + static_cast<unsigned>(p[j] - '0');
        }
        if (v > 255) return false;
        octets[i] = static_cast<uint8_t>(v);
    }
    return true;
}

BlockDecision classify_ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
    if (a == 127) {
        return BlockDecision::block("Access to loopback addresses is not allowed");
    }
    if (a == 10) {
        return BlockDecision::block("Access to private network (10.x.x.x) is not allowed");
    }
    if (a == 172 && b >= 16 && b <= 31) {
        return BlockDecision::block("Access to private network (172.16-31.x.x) is not allowed");
    }
    if (a == 192 && b == 168) {
        return BlockDecision::block("Access to private network (192.168.x.x) is not allowed");
    }
    // Includes the 169.254.169.254 cloud metadata endpoint
    if (a == 169 && b == 254) {
        return BlockDecision::block("Access to link-local/metadata addresses (169.254.x.x) is not allowed");
    }
    if (a == 0) {
        return BlockDecision::block("Access to 0.x.x.x addresses is not allowed");
    }
    if (a == 100 && b >= 64 && b <= 127) {
        return BlockDecision::block("Access to shared/CGNAT addresses (100.64-127.x.x) is not allowed");
    }
    if (a == 198 && (b == 18 || b == 19)) {
        return BlockDecision::block("Access to benchmark addresses (198.18-19.x.x) is not allowed");
    }
    if (a == 255 && b == 255 && c == 255 && d == 255) {
        return BlockDecision::block("Access to broadcast address is not allowed");
    }
    return BlockDecision::allow();
}

BlockDecision classify_ipv4(const std::string& ip) {
    uint8_t o[4];
    if (!parse_ipv4(ip, o)) {
        return BlockDecision::allow();
    }
    return classify_ipv4(o[0], o[1], o[2], o[3]);
}

BlockDecision classify_ipv6(const std::string& ip) {
    const std::string normalized = canonical_ipv6(to_lower(ip));

    if (normalized == "::1") {
        return BlockDecision::block("Access to IPv6 localhost is not allowed");
    }

    // fe80::/10: the first ten bits are 1111111010
    std::string first_group = normalized.substr(0, normalized.find(':'));
    size_t digits = 0;
    while (digits < first_group.size() && digits < 4 && hex_value(first_group[digits]) >= 0) {
        ++digits;
    }
    unsigned group_value = 0;
    if (digits > 0 && parse_hex_group(first_group.substr(0, digits), group_value)) {
        if ((group_value & 0xffc0) == 0xfe80) {
            return BlockDecision::block("Access to IPv6 link-local addresses is not allowed");
        }
        // fc00::/7 on the group value: "fc::1" is 00fc and stays public
        if ((group_value & 0xfe00) == 0xfc00) {
            return BlockDecision::block("Access to IPv6 private addresses is not allowed");
        }
    }

    static const std::string kMappedPrefix = "::ffff:";
    if (starts_with(normalized, kMappedPrefix)) {
        std::string tail = normalized.substr(kMappedPrefix.size());

        // ::ffff:a.b.c.d
        uint8_t o[4];
        if (parse_ipv4(tail, o)) {
            return mapped_ipv4_decision(classify_ipv4(o[0], o[1], o[2], o[3]));
        }

        // ::ffff:hhhh:hhhh
        size_t colon = tail.find(':');
        unsigned high = 0;
        unsigned low = 0;
        if (colon != std::string::npos &&
            parse_hex_group(tail.substr(0, colon), high) &&
            parse_hex_group(tail.substr(colon + 1), low)) {
            return mapped_ipv4_decision(classify_ipv4(
                static_cast<uint8_t>((high >> 8) & 0xff), static_cast<uint8_t>(high & 0xff),
                static_cast<uint8_t>((low >> 8) & 0xff), static_cast<uint8_t>(low & 0xff)));
        }
    }

    return BlockDecision::allow();
}

// ============================================================================
// AddressValidationResult
// ============================================================================

std::string AddressValidationResult::host_resolver_rule() const {
    if (!valid || hostname.empty() || resolved_address.empty()) return "";
    std::string target = resolved_address.find(':') != std::string::npos
        ? "[" + resolved_address + "]"
        : resolved_address;
    return "MAP " + hostname + " " + target;
}

std::string AddressValidationResult::curl_resolve_entry(int port) const {
    if (!valid || hostname.empty() || resolved_address.empty()) return "";
    std::string target = resolved_address.find(':') != std::string::npos
        ? "[" + resolved_address + "]"
        : resolved_address;
    return hostname + ":" + std::to_string(port) + ":" + target;
}

Json AddressValidationResult::to_json() const {
    Json j;
    j["valid"] = valid;
    if (!error.empty()) j["error"] = error;
    if (!resolved_address.empty()) j["resolved_address"] = resolved_address;
    if (!hostname.empty()) j["hostname"] = hostname;
    return j;
}

// ============================================================================
// AddressValidator
// ============================================================================

AddressValidationResult AddressValidator::validate(const std::string& url) {
    SystemDnsResolver resolver;
    return validate(url, resolver);
}

AddressValidationResult AddressValidator::validate(const std::string& url, DnsResolver& resolver) {
    std::string input = trim(url);
    if (input.empty() || input.find('\0') != std::string::npos) {
        LOG_WARN("[AddressValidator] Rejected malformed URL");
        return AddressValidationResult::fail("Invalid URL format");
    }

    CurlUrlPtr handle(curl_url());
    if (!handle ||
        curl_url_set(handle.get(), CURLUPART_URL, input.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
        LOG_WARN("[AddressValidator] Rejected malformed URL: %s", input.c_str());
        return AddressValidationResult::fail("Invalid URL format");
    }

    std::string scheme;
    if (!get_url_part(handle.get(), CURLUPART_SCHEME, scheme)) {
        return AddressValidationResult::fail("Invalid URL format");
    }
    scheme = to_lower(scheme);
    if (scheme != "http" && scheme != "https") {
        LOG_WARN("[AddressValidator] Rejected scheme '%s'", scheme.c_str());
        return AddressValidationResult::fail("Only http and https protocols are allowed");
    }

    std::string hostname;
    if (!get_url_part(handle.get(), CURLUPART_HOST, hostname) || hostname.empty()) {
        return AddressValidationResult::fail("Invalid URL format");
    }
    hostname = to_lower(hostname);

    if (hostname == "localhost" || hostname == "localhost.localdomain") {
        LOG_WARN("[AddressValidator] Rejected localhost URL: %s", input.c_str());
        return AddressValidationResult::fail("Access to localhost is not allowed");
    }
    if (hostname == "[::1]") {
        LOG_WARN("[AddressValidator] Rejected IPv6 localhost URL: %s", input.c_str());
        return AddressValidationResult::fail("Access to IPv6 localhost is not allowed");
    }

    // Literal addresses never touch DNS
    uint8_t o[4];
    if (parse_ipv4(hostname, o)) {
        BlockDecision d = classify_ipv4(o[0], o[1], o[2], o[3]);
        if (d.blocked) {
            LOG_WARN("[AddressValidator] %s: %s", hostname.c_str(), d.reason.c_str());
            return AddressValidationResult::fail(d.reason);
        }
        return AddressValidationResult::ok(hostname, hostname);
    }

    if (hostname.size() > 2 && hostname[0] == '[' && hostname[hostname.size() - 1] == ']') {
        std::string literal = hostname.substr(1, hostname.size() - 2);
        BlockDecision d = classify_ipv6(literal);
        if (d.blocked) {
            LOG_WARN("[AddressValidator] %s: %s", hostname.c_str(), d.reason.c_str());
            return AddressValidationResult::fail(d.reason);
        }
        return AddressValidationResult::ok(hostname, literal);
    }

    return validate_resolved(hostname, resolver);
}

AddressValidationResult AddressValidator::validate_resolved(const std::string& hostname,
                                                            DnsResolver& resolver) {
    std::vector<ResolvedAddress> addresses;
    try {
        addresses = resolver.lookup(hostname);
    } catch (const std::exception& e) {
        // Fail closed: a name we cannot resolve is a name we cannot vouch for
        LOG_WARN("[AddressValidator] DNS lookup for %s failed: %s", hostname.c_str(), e.what());
        return AddressValidationResult::fail(std::string("DNS resolution failed: ") + e.what());
    }

    if (addresses.empty()) {
        LOG_WARN("[AddressValidator] DNS lookup for %s returned nothing", hostname.c_str());
        return AddressValidationResult::fail("DNS resolution returned no addresses");
    }

    std::string pinned;
    for (size_t i = 0; i < addresses.size(); ++i) {
        BlockDecision d = classify_resolved(addresses[i]);
        if (d.blocked) {
            LOG_WARN("[AddressValidator] %s resolved to blocked address %s: %s",
                     hostname.c_str(), addresses[i].address.c_str(), d.reason.c_str());
            return AddressValidationResult::fail("DNS resolved to blocked IP: " + d.reason);
        }
        if (pinned.empty()) {
            pinned = addresses[i].address;
        }
    }

    LOG_DEBUG("[AddressValidator] %s pinned to %s (%zu candidates checked)",
              hostname.c_str(), pinned.c_str(), addresses.size());
    return AddressValidationResult::ok(hostname, pinned);
}

} // namespace shotguard
