#include <shotguard/security/dns_resolver.hpp>
#include <shotguard/core/logger.hpp>

#include <algorithm>
#include <cstring>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>

namespace shotguard {

std::vector<ResolvedAddress> SystemDnsResolver::lookup(const std::string& hostname) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(hostname.c_str(), nullptr, &hints, &res);
    if (rc != 0) {
        throw DnsResolutionError(std::string("getaddrinfo ") + gai_strerror(rc) + " " + hostname);
    }

    std::vector<ResolvedAddress> addresses;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        char buf[INET6_ADDRSTRLEN];
        ResolvedAddress entry;

        if (ai->ai_family == AF_INET) {
            const struct sockaddr_in* sin = reinterpret_cast<const struct sockaddr_in*>(ai->ai_addr);
            if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;
            entry = ResolvedAddress(buf, AddressFamily::IPv4);
        } else if (ai->ai_family == AF_INET6) {
            const struct sockaddr_in6* sin6 = reinterpret_cast<const struct sockaddr_in6*>(ai->ai_addr);
            if (!inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf))) continue;
            entry = ResolvedAddress(buf, AddressFamily::IPv6);
        } else {
            continue;
        }

        if (std::find(addresses.begin(), addresses.end(), entry) == addresses.end()) {
            addresses.push_back(entry);
        }
    }
    freeaddrinfo(res);

    LOG_DEBUG("[DNS] %s -> %zu address(es)", hostname.c_str(), addresses.size());
    return addresses;
}

} // namespace shotguard
