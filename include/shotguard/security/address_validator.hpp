/*
 * shotguard - Address Validator (SSRF / DNS rebinding)
 *
 * Decides whether a model-supplied URL may be fetched. Literal addresses
 * are classified directly; hostnames are resolved and EVERY answer must
 * pass, because the connection may end up on any of them. The surviving
 * address is returned so the caller can pin the connection to it and
 * the network stack never performs a second, unvalidated lookup.
 *
 * Blocked ranges:
 *   IPv4  127/8, 10/8, 172.16/12, 192.168/16, 169.254/16, 0/8,
 *         100.64/10, 198.18/15, 255.255.255.255
 *   IPv6  ::1, fe80::/10, fc00::/7, ::ffff:<blocked IPv4>
 */
#ifndef shotguard_SECURITY_ADDRESS_VALIDATOR_HPP
#define shotguard_SECURITY_ADDRESS_VALIDATOR_HPP

#include <shotguard/core/json.hpp>
#include <shotguard/security/dns_resolver.hpp>
#include <string>
#include <cstdint>

namespace shotguard {

// Outcome of a single range-membership check.
struct BlockDecision {
    bool blocked;
    std::string reason;

    BlockDecision() : blocked(false) {}

    static BlockDecision allow() { return BlockDecision(); }

    static BlockDecision block(const std::string& why) {
        BlockDecision d;
        d.blocked = true;
        d.reason = why;
        return d;
    }
};

struct AddressValidationResult {
    bool valid;
    std::string error;
    std::string resolved_address;   // address to pin the connection to
    std::string hostname;           // lower-cased; IPv6 literals keep their brackets

    AddressValidationResult() : valid(false) {}

    static AddressValidationResult ok(const std::string& host, const std::string& address) {
        AddressValidationResult r;
        r.valid = true;
        r.hostname = host;
        r.resolved_address = address;
        return r;
    }

    static AddressValidationResult fail(const std::string& err) {
        AddressValidationResult r;
        r.error = err;
        return r;
    }

    // Chromium --host-resolver-rules value: "MAP example.com 93.184.216.34".
    // Empty when the result is not valid.
    std::string host_resolver_rule() const;

    // libcurl CURLOPT_RESOLVE entry: "example.com:443:93.184.216.34".
    // Empty when the result is not valid.
    std::string curl_resolve_entry(int port) const;

    Json to_json() const;

    bool operator==(const AddressValidationResult& other) const {
        return valid == other.valid && error == other.error &&
               resolved_address == other.resolved_address && hostname == other.hostname;
    }
};

// Strict dotted-quad parse: four 1-3 digit groups, each <= 255.
bool parse_ipv4(const std::string& ip, uint8_t octets[4]);

BlockDecision classify_ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d);

// Non-IPv4 input is reported as not blocked; callers that require an
// address use parse_ipv4 first.
BlockDecision classify_ipv4(const std::string& ip);

// Textual classification. Input that inet_pton accepts is first
// rewritten to its canonical form, so every spelling of an address is
// classified identically.
BlockDecision classify_ipv6(const std::string& ip);

class AddressValidator {
public:
    static AddressValidationResult validate(const std::string& url, DnsResolver& resolver);

    // Uses SystemDnsResolver.
    static AddressValidationResult validate(const std::string& url);

private:
    static AddressValidationResult validate_resolved(const std::string& hostname,
                                                     DnsResolver& resolver);
};

} // namespace shotguard

#endif // shotguard_SECURITY_ADDRESS_VALIDATOR_HPP
