/**
 * Unit tests for CaptureGuard (preflight ordering and gate ownership)
 * and NavigationGuard (redirect re-validation).
 */

#include <gtest/gtest.h>

#include <shotguard/core/capture_guard.hpp>
#include <shotguard/core/config.hpp>
#include <shotguard/core/utils.hpp>
#include "mocks.hpp"

#include <cstdlib>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

using namespace shotguard;
using shotguard::mocks::MockDnsResolver;
using shotguard::mocks::MockRealPathResolver;

namespace {

const char* const kScreens = "/home/test/Desktop/Screenshots";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

class CaptureGuardTest : public ::testing::Test {
protected:
    CaptureGuardTest() : guard_(make_allow_list(), 1, dns_, fs_) {}

    void SetUp() override {
        dns_.add("example.com", "93.184.216.34", AddressFamily::IPv4)
            .add("other.example", "93.184.216.35", AddressFamily::IPv4)
            .add("internal.example", "10.0.0.7", AddressFamily::IPv4);
        fs_.exists(kScreens).exists("/tmp").exists("/etc");
    }

    static AllowListConfig make_allow_list() {
        AllowListConfig cfg;
        cfg.default_directory = kScreens;
        cfg.allowed_directories.push_back(kScreens);
        cfg.allowed_directories.push_back("/tmp");
        return cfg;
    }

    MockDnsResolver dns_;
    MockRealPathResolver fs_;
    CaptureGuard guard_;
};

} // namespace

// ============================================================================
// Web capture preflight
// ============================================================================

TEST_F(CaptureGuardTest, AdmitsPublicUrlWithDefaultDestination) {
    CapturePreflight p = guard_.prepare_web_capture("https://example.com/", "");
    ASSERT_TRUE(p.allowed) << p.error;
    EXPECT_TRUE(p.permit.lease.held());
    EXPECT_EQ(p.permit.hostname, "example.com");
    EXPECT_EQ(p.permit.pinned_address, "93.184.216.34");
    EXPECT_EQ(p.permit.host_resolver_rule(), "MAP example.com 93.184.216.34");
    EXPECT_TRUE(starts_with(p.permit.destination,
                            "/home/test/Desktop/Screenshots/screenshot-"));
    EXPECT_TRUE(ends_with(p.permit.destination, ".png"));
}

TEST_F(CaptureGuardTest, CustomDestinationIsResolved) {
    CapturePreflight p = guard_.prepare_web_capture("https://example.com/", "/tmp/page.png");
    ASSERT_TRUE(p.allowed) << p.error;
    EXPECT_EQ(p.permit.destination, "/tmp/page.png");
}

TEST_F(CaptureGuardTest, SecondConcurrentCaptureIsRefused) {
    CapturePreflight first = guard_.prepare_web_capture("https://example.com/", "");
    ASSERT_TRUE(first.allowed);

    CapturePreflight second = guard_.prepare_web_capture("https://example.com/", "");
    EXPECT_FALSE(second.allowed);
    EXPECT_EQ(second.error,
              "Concurrent screenshot limit reached (max 1). "
              "Please wait for existing screenshots to complete.");
}

TEST_F(CaptureGuardTest, DroppingThePermitFreesTheSlot) {
    {
        CapturePreflight p = guard_.prepare_web_capture("https://example.com/", "");
        ASSERT_TRUE(p.allowed);
        EXPECT_EQ(guard_.gate().available(), 0u);
    }
    EXPECT_EQ(guard_.gate().available(), 1u);
    EXPECT_TRUE(guard_.prepare_web_capture("https://example.com/", "").allowed);
}

TEST_F(CaptureGuardTest, BlockedUrlIsRefusedBeforeTheGate) {
    CapturePreflight p = guard_.prepare_web_capture("http://internal.example/", "");
    EXPECT_FALSE(p.allowed);
    EXPECT_EQ(p.error, "URL validation failed: DNS resolved to blocked IP: "
                       "Access to private network (10.x.x.x) is not allowed");
    EXPECT_EQ(guard_.gate().available(), 1u);
}

TEST_F(CaptureGuardTest, BadPathIsRefusedBeforeTheGate) {
    CapturePreflight p = guard_.prepare_web_capture("https://example.com/", "/etc/shot.png");
    EXPECT_FALSE(p.allowed);
    EXPECT_EQ(p.error.find("Output path validation failed: "), 0u);
    EXPECT_EQ(guard_.gate().available(), 1u);
}

TEST_F(CaptureGuardTest, UrlIsCheckedBeforePath) {
    CapturePreflight p = guard_.prepare_web_capture("ftp://example.com/", "/etc/shot.png");
    EXPECT_FALSE(p.allowed);
    EXPECT_EQ(p.error, "URL validation failed: Only http and https protocols are allowed");
}

TEST_F(CaptureGuardTest, PermitJson) {
    CapturePreflight p = guard_.prepare_web_capture("https://example.com/", "/tmp/a.png");
    ASSERT_TRUE(p.allowed);
    Json j = p.permit.to_json();
    EXPECT_EQ(j["destination"].get<std::string>(), "/tmp/a.png");
    EXPECT_TRUE(j["gated"].get<bool>());
    EXPECT_EQ(j["pinned_address"].get<std::string>(), "93.184.216.34");
    EXPECT_EQ(j["host_resolver_rule"].get<std::string>(), "MAP example.com 93.184.216.34");
}

// ============================================================================
// System capture preflight
// ============================================================================

TEST_F(CaptureGuardTest, SystemCaptureIsNotGated) {
    CapturePreflight web = guard_.prepare_web_capture("https://example.com/", "");
    ASSERT_TRUE(web.allowed);

    CapturePreflight sys = guard_.prepare_system_capture("", "");
    ASSERT_TRUE(sys.allowed) << sys.error;
    EXPECT_FALSE(sys.permit.lease.held());
    EXPECT_TRUE(starts_with(sys.permit.destination,
                            "/home/test/Desktop/Screenshots/system-screenshot-"));
    EXPECT_TRUE(ends_with(sys.permit.destination, ".png"));
}

TEST_F(CaptureGuardTest, SystemCaptureFormats) {
    CapturePreflight jpg = guard_.prepare_system_capture("", "jpg");
    ASSERT_TRUE(jpg.allowed);
    EXPECT_TRUE(ends_with(jpg.permit.destination, ".jpg"));

    CapturePreflight gif = guard_.prepare_system_capture("", "gif");
    EXPECT_FALSE(gif.allowed);
    EXPECT_EQ(gif.error, "Unsupported image format 'gif' (expected png or jpg)");
}

TEST_F(CaptureGuardTest, SystemCaptureValidatesPath) {
    CapturePreflight p = guard_.prepare_system_capture("../../../../etc/x.png", "png");
    EXPECT_FALSE(p.allowed);
    EXPECT_EQ(p.error.find("Output path validation failed: "), 0u);
}

TEST_F(CaptureGuardTest, Status) {
    Json s = guard_.status();
    EXPECT_EQ(s["capacity"].get<size_t>(), 1u);
    EXPECT_EQ(s["available"].get<size_t>(), 1u);
    EXPECT_EQ(s["waiting"].get<size_t>(), 0u);
    EXPECT_EQ(s["default_directory"].get<std::string>(), kScreens);
    EXPECT_EQ(s["allowed_directories"].size(), 2u);
}

// ============================================================================
// Construction from configuration
// ============================================================================

TEST(CaptureGuardConfig, CapacityFromConfig) {
    MockDnsResolver dns;
    MockRealPathResolver fs;

    Config c;
    ASSERT_TRUE(c.load_string("{\"capture\": {\"max_concurrent\": 5}}"));
    CaptureGuard five(c, dns, fs);
    EXPECT_EQ(five.gate().capacity(), 5u);

    Config bad;
    ASSERT_TRUE(bad.load_string("{\"capture\": {\"max_concurrent\": 0}}"));
    CaptureGuard fallback(bad, dns, fs);
    EXPECT_EQ(fallback.gate().capacity(), CaptureGuard::DEFAULT_MAX_CONCURRENT);

    Config empty;
    CaptureGuard def(empty, dns, fs);
    EXPECT_EQ(def.gate().capacity(), 3u);
}

TEST(CaptureGuardConfig, EnsureDefaultDirectoryCreatesIt) {
    char tmpl[] = "/tmp/shotguard-test-XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    std::string base(tmpl);

    AllowListConfig allow;
    allow.default_directory = base + "/nested/Screenshots";
    allow.allowed_directories.push_back(allow.default_directory);

    MockDnsResolver dns;
    MockRealPathResolver fs;
    CaptureGuard guard(allow, 1, dns, fs);
    ASSERT_TRUE(guard.ensure_default_directory());
    EXPECT_TRUE(guard.ensure_default_directory());

    struct stat st;
    ASSERT_EQ(stat(allow.default_directory.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));

    rmdir(allow.default_directory.c_str());
    rmdir((base + "/nested").c_str());
    rmdir(base.c_str());
}

TEST(CapturePermit, PrepareDestinationCreatesParent) {
    char tmpl[] = "/tmp/shotguard-test-XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    std::string base(tmpl);

    CapturePermit permit;
    permit.destination = base + "/a/b/shot.png";
    ASSERT_TRUE(permit.prepare_destination());

    struct stat st;
    EXPECT_EQ(stat((base + "/a/b").c_str(), &st), 0);

    rmdir((base + "/a/b").c_str());
    rmdir((base + "/a").c_str());
    rmdir(base.c_str());
}

// ============================================================================
// Redirect re-validation
// ============================================================================

TEST_F(CaptureGuardTest, NavigationOriginalUrlPassesWithoutLookup) {
    NavigationGuard nav = guard_.navigation_guard("https://example.com/start");
    int before = dns_.calls();
    EXPECT_TRUE(nav.allow("https://example.com/start"));
    EXPECT_EQ(dns_.calls(), before);
    EXPECT_EQ(nav.original_url(), "https://example.com/start");
}

TEST_F(CaptureGuardTest, NavigationBlocksRedirectToMetadata) {
    NavigationGuard nav = guard_.navigation_guard("https://example.com/");
    AddressValidationResult r = nav.check("http://169.254.169.254/latest/meta-data/");
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(nav.allow("http://internal.example/"));
    EXPECT_EQ(nav.blocked_count(), 2u);
}

TEST_F(CaptureGuardTest, NavigationAllowsPublicRedirect) {
    NavigationGuard nav = guard_.navigation_guard("https://example.com/");
    EXPECT_TRUE(nav.allow("https://other.example/landing"));
    EXPECT_TRUE(nav.allow("https://example.com/other-page"));
    EXPECT_EQ(nav.blocked_count(), 0u);
}
