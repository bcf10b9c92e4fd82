/*
 * In-memory doubles for the DNS and real-path capabilities.
 */
#ifndef shotguard_TESTS_MOCKS_HPP
#define shotguard_TESTS_MOCKS_HPP

#include <shotguard/security/dns_resolver.hpp>
#include <shotguard/security/realpath_resolver.hpp>

#include <cerrno>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace shotguard {
namespace mocks {

// Answers from a fixed table; unknown names fail like NXDOMAIN.
class MockDnsResolver : public DnsResolver {
public:
    MockDnsResolver() : calls_(0) {}

    MockDnsResolver& add(const std::string& host, const std::string& address, AddressFamily family) {
        answers_[host].push_back(ResolvedAddress(address, family));
        return *this;
    }

    MockDnsResolver& add_empty(const std::string& host) {
        answers_[host];
        return *this;
    }

    std::vector<ResolvedAddress> lookup(const std::string& hostname) override {
        ++calls_;
        std::map<std::string, std::vector<ResolvedAddress> >::const_iterator it = answers_.find(hostname);
        if (it == answers_.end()) {
            throw DnsResolutionError("getaddrinfo ENOTFOUND " + hostname);
        }
        return it->second;
    }

    int calls() const { return calls_; }

private:
    std::map<std::string, std::vector<ResolvedAddress> > answers_;
    int calls_;
};

class TimeoutDnsResolver : public DnsResolver {
public:
    std::vector<ResolvedAddress> lookup(const std::string& hostname) override {
        throw DnsResolutionError("queryA ETIMEOUT " + hostname);
    }
};

// realpath() from a table of existing paths; everything else is ENOENT.
class MockRealPathResolver : public RealPathResolver {
public:
    MockRealPathResolver& map(const std::string& path, const std::string& real) {
        paths_[path] = real;
        return *this;
    }

    // Path exists in the table of mappings as itself.
    MockRealPathResolver& exists(const std::string& path) {
        return map(path, path);
    }

    MockRealPathResolver& fail(const std::string& path, int err) {
        errors_[path] = err;
        return *this;
    }

    MockRealPathResolver& dangling_symlink(const std::string& path) {
        symlinks_.insert(path);
        return *this;
    }

    std::string realpath(const std::string& path) override {
        std::map<std::string, int>::const_iterator e = errors_.find(path);
        if (e != errors_.end()) {
            throw PathResolutionError("realpath '" + path + "' failed", e->second);
        }
        std::map<std::string, std::string>::const_iterator it = paths_.find(path);
        if (it == paths_.end()) {
            throw PathResolutionError("ENOENT: no such file or directory, realpath '" + path + "'", ENOENT);
        }
        return it->second;
    }

    bool is_symlink(const std::string& path) override {
        return symlinks_.count(path) > 0;
    }

private:
    std::map<std::string, std::string> paths_;
    std::map<std::string, int> errors_;
    std::set<std::string> symlinks_;
};

} // namespace mocks
} // namespace shotguard

#endif // shotguard_TESTS_MOCKS_HPP
