//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Deepr Contributors
// File: SsrfProtector.h
// Purpose: Outbound request guard that keeps research agents away from internal network addresses
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace deepr {
namespace security {

//==========================================================================================================
// BlockedNetworks
// Purpose: CIDR ranges treated as internal: loopback, private-use, link-local, shared address space,
//          documentation and benchmarking blocks, multicast, reserved, unique-local, and their IPv6
//          counterparts.
//==========================================================================================================
const std::vector<std::string>& BlockedNetworks();

//==========================================================================================================
// IsInternalIp
// Purpose: True when the literal address falls in a blocked range. IPv4-mapped IPv6 addresses are checked
//          as IPv4. A string that does not parse as an address is treated as internal.
//==========================================================================================================
bool IsInternalIp(const std::string& ip);

//==========================================================================================================
// ExtractHostname
// Purpose: Lower-cased host of an absolute or scheme-relative URL ("scheme://host..." or "//host...").
//          Userinfo, port, and IPv6 brackets are removed.
// Returns:
//   std::nullopt when the URL has no network location or an empty host.
//==========================================================================================================
std::optional<std::string> ExtractHostname(const std::string& url);

// Splits a comma-separated domain list, trimming blanks and dropping empty items.
std::vector<std::string> ParseDomainList(const std::string& csv);

// ParseDomainList(DEEPR_MCP_ALLOWED_DOMAINS); empty when unset.
std::vector<std::string> AllowedDomainsFromEnvironment();

//==========================================================================================================
// SsrfBlockedError
// Purpose: Typed rejection raised by SsrfProtector.
//==========================================================================================================
class SsrfBlockedError : public std::runtime_error {
public:
    enum class Reason {
        NoHostname,
        NotInAllowlist,
        ResolvesToInternal,
        InternalIp
    };

    SsrfBlockedError(Reason reason, const std::string& message, std::string host = {}, std::string address = {})
        : std::runtime_error(message), reason_(reason), host_(std::move(host)), address_(std::move(address)) {}

    Reason GetReason() const noexcept { return reason_; }
    const std::string& Host() const noexcept { return host_; }
    const std::string& Address() const noexcept { return address_; }

private:
    Reason reason_;
    std::string host_;
    std::string address_;
};

const char* ToString(SsrfBlockedError::Reason reason);

//==========================================================================================================
// IHostResolver
// Purpose: Name resolution seam. Resolve returns every address (IPv4 and IPv6) for the host, or an empty
//          list when the name does not resolve.
//==========================================================================================================
class IHostResolver {
public:
    virtual ~IHostResolver() = default;
    virtual std::vector<std::string> Resolve(const std::string& host) = 0;
};

// System resolver backed by boost::asio::ip::tcp::resolver.
class AsioHostResolver : public IHostResolver {
public:
    std::vector<std::string> Resolve(const std::string& host) override;
};

//==========================================================================================================
// SsrfProtector
// Purpose: Validates URLs and literal addresses before an outbound request.
// Notes:
//   - Holds no per-request state; concurrent validations are independent.
//   - A hostname that does not resolve at all is allowed through (logged at WARN). This keeps
//     legitimate hosts usable during resolver outages at the cost of trusting a later resolution.
//==========================================================================================================
class SsrfProtector {
public:
    //==========================================================================================================
    // Args:
    //   allowedDomains: When non-empty, only these hostnames (case-insensitive) may be contacted.
    //   auditLog: Log each decision (hostname -> resolved addresses).
    //   resolver: Name resolver; defaults to AsioHostResolver.
    //==========================================================================================================
    explicit SsrfProtector(std::vector<std::string> allowedDomains = {},
                           bool auditLog = true,
                           std::shared_ptr<IHostResolver> resolver = nullptr);

    //==========================================================================================================
    // Check
    // Purpose: Non-throwing validation.
    // Returns:
    //   std::nullopt when the URL is allowed, otherwise the rejection.
    //==========================================================================================================
    std::optional<SsrfBlockedError> Check(const std::string& url) const;

    // Returns url unchanged or throws SsrfBlockedError.
    std::string ValidateUrl(const std::string& url) const;
    // Returns ip unchanged or throws SsrfBlockedError(InternalIp).
    std::string ValidateIp(const std::string& ip) const;

    bool HasAllowlist() const { return !allowedDomains_.empty(); }

private:
    std::unordered_set<std::string> allowedDomains_;
    bool auditLog_;
    std::shared_ptr<IHostResolver> resolver_;
};

} // namespace security
} // namespace deepr
