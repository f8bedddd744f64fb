//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: SsrfProtector.cpp
// Purpose: Address classification, URL host extraction, and outbound request validation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <boost/asio/ip/network_v6.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "deepr/security/SsrfProtector.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace deepr {
namespace security {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

struct ParsedNetworks {
    std::vector<net::ip::network_v4> v4;
    std::vector<net::ip::network_v6> v6;
};

const ParsedNetworks& parsedNetworks() {
    static const ParsedNetworks parsed = []() {
        ParsedNetworks p;
        for (const auto& cidr : BlockedNetworks()) {
            if (cidr.find(':') != std::string::npos) {
                p.v6.push_back(net::ip::make_network_v6(cidr));
            } else {
                p.v4.push_back(net::ip::make_network_v4(cidr));
            }
        }
        return p;
    }();
    return parsed;
}

bool inNetwork(const net::ip::address_v4& addr, const net::ip::network_v4& network) {
    const auto mask = network.netmask().to_uint();
    return (addr.to_uint() & mask) == (network.network().to_uint() & mask);
}

bool inNetwork(const net::ip::address_v6& addr, const net::ip::network_v6& network) {
    const auto a = addr.to_bytes();
    const auto n = network.network().to_bytes();
    unsigned int bits = network.prefix_length();
    for (std::size_t i = 0; i < a.size() && bits > 0; ++i) {
        const unsigned int take = bits >= 8 ? 8u : bits;
        const unsigned char mask = static_cast<unsigned char>(0xFFu << (8u - take));
        if ((a[i] & mask) != (n[i] & mask)) {
            return false;
        }
        bits -= take;
    }
    return true;
}

bool isBlockedV4(const net::ip::address_v4& addr) {
    const auto& nets = parsedNetworks().v4;
    return std::any_of(nets.begin(), nets.end(), [&](const auto& n) { return inNetwork(addr, n); });
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string joinAddresses(const std::vector<std::string>& addrs) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < addrs.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << addrs[i];
    }
    oss << ']';
    return oss.str();
}

} // namespace

const std::vector<std::string>& BlockedNetworks() {
    static const std::vector<std::string> networks = {
        "0.0.0.0/8",          // "this" network
        "10.0.0.0/8",         // private-use
        "100.64.0.0/10",      // shared address space (CGNAT)
        "127.0.0.0/8",        // loopback
        "169.254.0.0/16",     // link-local, cloud metadata
        "172.16.0.0/12",      // private-use
        "192.0.0.0/24",       // IETF protocol assignments
        "192.0.2.0/24",       // TEST-NET-1
        "192.168.0.0/16",     // private-use
        "198.18.0.0/15",      // benchmarking
        "198.51.100.0/24",    // TEST-NET-2
        "203.0.113.0/24",     // TEST-NET-3
        "224.0.0.0/4",        // multicast
        "240.0.0.0/4",        // reserved, broadcast
        "::/128",             // unspecified
        "::1/128",            // loopback
        "64:ff9b:1::/48",     // local-use NAT64
        "100::/64",           // discard-only
        "2001:db8::/32",      // documentation
        "fc00::/7",           // unique-local
        "fe80::/10",          // link-local
        "fec0::/10",          // deprecated site-local
        "ff00::/8",           // multicast
    };
    return networks;
}

bool IsInternalIp(const std::string& ip) {
    boost::system::error_code ec;
    net::ip::address addr = net::ip::make_address(ip, ec);
    if (ec) {
        return true;
    }
    if (addr.is_v4()) {
        return isBlockedV4(addr.to_v4());
    }
    const net::ip::address_v6 v6 = addr.to_v6();
    if (v6.is_v4_mapped()) {
        return isBlockedV4(net::ip::make_address_v4(net::ip::v4_mapped, v6));
    }
    const auto& nets = parsedNetworks().v6;
    return std::any_of(nets.begin(), nets.end(), [&](const auto& n) { return inNetwork(v6, n); });
}

std::optional<std::string> ExtractHostname(const std::string& url) {
    std::size_t pos = 0;
    // Optional scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    std::size_t colon = url.find(':');
    if (colon != std::string::npos && colon > 0 && std::isalpha(static_cast<unsigned char>(url[0]))) {
        bool schemeChars = std::all_of(url.begin(), url.begin() + static_cast<std::ptrdiff_t>(colon), [](unsigned char c) {
            return std::isalnum(c) || c == '+' || c == '-' || c == '.';
        });
        if (schemeChars) {
            pos = colon + 1;
        }
    }
    if (url.compare(pos, 2, "//") != 0) {
        return std::nullopt;
    }
    pos += 2;
    std::size_t end = url.find_first_of("/?#", pos);
    std::string netloc = url.substr(pos, end == std::string::npos ? std::string::npos : end - pos);

    std::size_t at = netloc.rfind('@');
    if (at != std::string::npos) {
        netloc = netloc.substr(at + 1);
    }

    std::string host;
    if (!netloc.empty() && netloc[0] == '[') {
        std::size_t close = netloc.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        host = netloc.substr(1, close - 1);
    } else {
        host = netloc.substr(0, netloc.find(':'));
    }
    if (host.empty()) {
        return std::nullopt;
    }
    return toLower(host);
}

std::vector<std::string> ParseDomainList(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), notSpace));
        item.erase(std::find_if(item.rbegin(), item.rend(), notSpace).base(), item.end());
        if (!item.empty()) {
            out.push_back(toLower(item));
        }
    }
    return out;
}

std::vector<std::string> AllowedDomainsFromEnvironment() {
    return ParseDomainList(GetEnvOrDefault("DEEPR_MCP_ALLOWED_DOMAINS", ""));
}

const char* ToString(SsrfBlockedError::Reason reason) {
    switch (reason) {
        case SsrfBlockedError::Reason::NoHostname: return "no_hostname";
        case SsrfBlockedError::Reason::NotInAllowlist: return "not_in_allowlist";
        case SsrfBlockedError::Reason::ResolvesToInternal: return "resolves_to_internal";
        case SsrfBlockedError::Reason::InternalIp: return "internal_ip";
    }
    return "unknown";
}

std::vector<std::string> AsioHostResolver::Resolve(const std::string& host) {
    std::vector<std::string> out;
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    boost::system::error_code ec;
    auto results = resolver.resolve(host, "", ec);
    if (ec) {
        LOG_DEBUG("AsioHostResolver: '{}' did not resolve: {}", host, ec.message());
        return out;
    }
    for (const auto& entry : results) {
        std::string addr = entry.endpoint().address().to_string();
        if (std::find(out.begin(), out.end(), addr) == out.end()) {
            out.push_back(std::move(addr));
        }
    }
    return out;
}

SsrfProtector::SsrfProtector(std::vector<std::string> allowedDomains,
                             bool auditLog,
                             std::shared_ptr<IHostResolver> resolver)
    : auditLog_(auditLog), resolver_(std::move(resolver)) {
    for (auto& d : allowedDomains) {
        allowedDomains_.insert(toLower(std::move(d)));
    }
    if (!resolver_) {
        resolver_ = std::make_shared<AsioHostResolver>();
    }
}

std::optional<SsrfBlockedError> SsrfProtector::Check(const std::string& url) const {
    using Reason = SsrfBlockedError::Reason;

    const std::optional<std::string> hostname = ExtractHostname(url);
    if (!hostname.has_value()) {
        return SsrfBlockedError(Reason::NoHostname, "SSRF blocked: no hostname in URL: " + url);
    }
    const std::string& host = *hostname;

    if (!allowedDomains_.empty() && allowedDomains_.find(host) == allowedDomains_.end()) {
        if (auditLog_) {
            LOG_WARN("SsrfProtector: blocked '{}' (not in allowlist)", host);
        }
        return SsrfBlockedError(Reason::NotInAllowlist, "SSRF blocked: domain '" + host + "' not in allowlist", host);
    }

    std::vector<std::string> addresses;
    boost::system::error_code ec;
    (void)net::ip::make_address(host, ec);
    if (!ec) {
        // Literal address; no lookup needed
        addresses.push_back(host);
    } else {
        addresses = resolver_->Resolve(host);
    }

    if (addresses.empty()) {
        LOG_WARN("SsrfProtector: '{}' did not resolve; allowing without an address check", host);
        return std::nullopt;
    }

    for (const auto& addr : addresses) {
        if (IsInternalIp(addr)) {
            if (auditLog_) {
                LOG_WARN("SsrfProtector: blocked '{}' -> {}", host, addr);
            }
            return SsrfBlockedError(Reason::ResolvesToInternal,
                                    "SSRF blocked: '" + host + "' resolves to internal IP " + addr, host, addr);
        }
    }

    if (auditLog_) {
        LOG_DEBUG("SsrfProtector: URL validated: {} -> {}", host, joinAddresses(addresses));
    }
    return std::nullopt;
}

std::string SsrfProtector::ValidateUrl(const std::string& url) const {
    if (auto rejection = Check(url)) {
        throw *rejection;
    }
    return url;
}

std::string SsrfProtector::ValidateIp(const std::string& ip) const {
    if (IsInternalIp(ip)) {
        if (auditLog_) {
            LOG_WARN("SsrfProtector: blocked internal IP {}", ip);
        }
        throw SsrfBlockedError(SsrfBlockedError::Reason::InternalIp, "SSRF blocked: internal IP " + ip, {}, ip);
    }
    return ip;
}

} // namespace security
} // namespace deepr
