#pragma once

#include <optional>
#include <string>
#include <vector>

#include "egress/policy/DomainPattern.h"
#include "egress/policy/IpMask.h"
#include "egress/policy/Resolver.h"

namespace egress {
namespace policy {

// Destination policy for outbound requests. Deny lists always win over allow
// lists; an absent allow list allows everything the deny list does not reject,
// while an empty allow list rejects everything.
class AddressPolicy {
public:
    struct Config {
        bool allowDirectIp{false};
        std::optional<std::vector<std::string>> ipAllowList;
        std::vector<std::string> ipDenyList;
        std::optional<std::vector<DomainPattern>> domainAllowList;
        std::vector<DomainPattern> domainDenyList;
    };

    // Throws std::invalid_argument on an unparsable CIDR or a missing resolver.
    AddressPolicy(const Config& cfg, Resolver resolver);

    // Literal IPs: allowDirectIp + IsIpAllowed. Names: domain lists, then every
    // resolved address must pass IsIpAllowed. Resolver failures propagate.
    bool IsHostnameAllowed(const std::string& hostname) const;

    // Same evaluation as IsHostnameAllowed, returning the addresses that were
    // validated (the literal itself for IP hosts). Empty means rejected.
    std::vector<std::string> Resolve(const std::string& hostname) const;

    bool IsDomainAllowed(const std::string& domain) const;
    bool IsIpAllowed(const std::string& ip) const;

    bool allowDirectIp() const { return allowDirectIp_; }

    static bool IsIpLiteral(const std::string& host);

    // Lowercase, without one trailing dot.
    static std::string NormalizeHostname(const std::string& host);

private:
    bool allowDirectIp_;
    std::optional<std::vector<IpMask>> ipAllow_;
    std::vector<IpMask> ipDeny_;
    std::optional<std::vector<DomainPattern>> domainAllow_;
    std::vector<DomainPattern> domainDeny_;
    Resolver resolver_;
};

} // namespace policy
} // namespace egress
