//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: test_ssrf.cpp
// Purpose: Outbound URL guard: blocked ranges, allowlists and resolved-address checks
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "deepr/security/SsrfProtector.h"

using namespace deepr::security;

namespace {

class FakeResolver : public IHostResolver {
public:
    std::map<std::string, std::vector<std::string>> table;
    int calls{0};

    std::vector<std::string> Resolve(const std::string& host) override {
        ++calls;
        auto it = table.find(host);
        return it == table.end() ? std::vector<std::string>{} : it->second;
    }
};

} // namespace

TEST(SsrfInternalIp, BlocksPrivateLoopbackAndMetadata) {
    for (const char* ip : {"10.1.2.3", "127.0.0.1", "169.254.169.254", "172.16.0.1", "172.31.255.255",
                           "192.168.1.10", "100.64.0.1", "0.0.0.0", "224.0.0.1", "255.255.255.255",
                           "::1", "fe80::1", "fd00::1", "::ffff:127.0.0.1", "::ffff:10.0.0.1"}) {
        EXPECT_TRUE(IsInternalIp(ip)) << ip;
    }
}

TEST(SsrfInternalIp, AllowsPublicAddresses) {
    for (const char* ip : {"8.8.8.8", "1.1.1.1", "172.32.0.1", "93.184.216.34", "2606:4700:4700::1111",
                           "::ffff:8.8.8.8"}) {
        EXPECT_FALSE(IsInternalIp(ip)) << ip;
    }
}

TEST(SsrfInternalIp, UnparseableIsTreatedAsInternal) {
    EXPECT_TRUE(IsInternalIp("not-an-ip"));
    EXPECT_TRUE(IsInternalIp(""));
    EXPECT_TRUE(IsInternalIp("999.1.1.1"));
}

TEST(SsrfHostname, Extraction) {
    EXPECT_EQ(ExtractHostname("https://Example.COM/path?q=1").value_or(""), "example.com");
    EXPECT_EQ(ExtractHostname("http://user:pw@host.test:8080/x").value_or(""), "host.test");
    EXPECT_EQ(ExtractHostname("http://[::1]:8080/").value_or(""), "::1");
    EXPECT_EQ(ExtractHostname("//cdn.example.org/lib.js").value_or(""), "cdn.example.org");
    EXPECT_FALSE(ExtractHostname("not a url").has_value());
    EXPECT_FALSE(ExtractHostname("http:///path").has_value());
    EXPECT_FALSE(ExtractHostname("mailto:someone@example.com").has_value());
}

TEST(SsrfProtector, RejectsUrlWithoutHost) {
    auto resolver = std::make_shared<FakeResolver>();
    SsrfProtector guard({}, true, resolver);
    auto rejection = guard.Check("file:///etc/passwd");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->GetReason(), SsrfBlockedError::Reason::NoHostname);
    EXPECT_EQ(resolver->calls, 0);
}

TEST(SsrfProtector, LiteralInternalAddressIsBlockedWithoutLookup) {
    auto resolver = std::make_shared<FakeResolver>();
    SsrfProtector guard({}, true, resolver);
    try {
        guard.ValidateUrl("http://169.254.169.254/latest/meta-data/");
        FAIL() << "expected SsrfBlockedError";
    } catch (const SsrfBlockedError& e) {
        EXPECT_EQ(e.GetReason(), SsrfBlockedError::Reason::ResolvesToInternal);
        EXPECT_EQ(e.Address(), "169.254.169.254");
    }
    EXPECT_EQ(resolver->calls, 0);
}

TEST(SsrfProtector, HostResolvingToAnyInternalAddressIsBlocked) {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->table["rebind.test"] = {"93.184.216.34", "10.0.0.5"};
    resolver->table["public.test"] = {"93.184.216.34"};
    SsrfProtector guard({}, false, resolver);

    auto rejection = guard.Check("https://rebind.test/");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->GetReason(), SsrfBlockedError::Reason::ResolvesToInternal);
    EXPECT_EQ(rejection->Host(), "rebind.test");
    EXPECT_EQ(rejection->Address(), "10.0.0.5");

    EXPECT_EQ(guard.ValidateUrl("https://public.test/a"), "https://public.test/a");
}

TEST(SsrfProtector, UnresolvableHostIsAllowed) {
    auto resolver = std::make_shared<FakeResolver>();
    SsrfProtector guard({}, true, resolver);
    EXPECT_FALSE(guard.Check("https://does-not-resolve.invalid/").has_value());
    EXPECT_EQ(resolver->calls, 1);
}

TEST(SsrfProtector, AllowlistIsCaseInsensitiveAndChecked) {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->table["docs.example.com"] = {"93.184.216.34"};
    SsrfProtector guard({"Docs.Example.com"}, true, resolver);
    EXPECT_TRUE(guard.HasAllowlist());

    EXPECT_FALSE(guard.Check("https://DOCS.example.com/page").has_value());

    auto rejection = guard.Check("https://other.example.com/");
    ASSERT_TRUE(rejection.has_value());
    EXPECT_EQ(rejection->GetReason(), SsrfBlockedError::Reason::NotInAllowlist);
    EXPECT_STREQ(ToString(rejection->GetReason()), "not_in_allowlist");
}

TEST(SsrfProtector, AllowlistedHostStillCheckedForInternalAddress) {
    auto resolver = std::make_shared<FakeResolver>();
    resolver->table["intranet.corp"] = {"192.168.0.10"};
    SsrfProtector guard({"intranet.corp"}, true, resolver);
    EXPECT_THROW(guard.ValidateUrl("http://intranet.corp/"), SsrfBlockedError);
}

TEST(SsrfProtector, ValidateIp) {
    SsrfProtector guard({}, true, std::make_shared<FakeResolver>());
    EXPECT_EQ(guard.ValidateIp("8.8.4.4"), "8.8.4.4");
    try {
        guard.ValidateIp("127.0.0.1");
        FAIL() << "expected SsrfBlockedError";
    } catch (const SsrfBlockedError& e) {
        EXPECT_EQ(e.GetReason(), SsrfBlockedError::Reason::InternalIp);
    }
}

TEST(SsrfDomains, ParseDomainList) {
    const std::vector<std::string> expected = {"example.com", "api.test"};
    EXPECT_EQ(ParseDomainList(" Example.com , ,API.test,"), expected);
    EXPECT_TRUE(ParseDomainList("").empty());
}

TEST(SsrfDomains, AllowedDomainsFromEnvironment) {
    ::setenv("DEEPR_MCP_ALLOWED_DOMAINS", "a.example,b.example", 1);
    const std::vector<std::string> expected = {"a.example", "b.example"};
    EXPECT_EQ(AllowedDomainsFromEnvironment(), expected);
    ::unsetenv("DEEPR_MCP_ALLOWED_DOMAINS");
    EXPECT_TRUE(AllowedDomainsFromEnvironment().empty());
}
