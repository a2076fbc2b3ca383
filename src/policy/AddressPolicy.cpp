#include "egress/policy/AddressPolicy.h"
#include "egress/common/Logger.h"

#include <cctype>
#include <stdexcept>

namespace egress {
namespace policy {

static std::vector<IpMask> ParseMasks(const std::vector<std::string>& cidrs, const char* what) {
    std::vector<IpMask> out;
    out.reserve(cidrs.size());
    for (const auto& c : cidrs) {
        IpMask m;
        if (!IpMask::Parse(c, &m)) {
            throw std::invalid_argument(std::string("invalid CIDR in ") + what + ": '" + c + "'");
        }
        out.push_back(m);
    }
    return out;
}

AddressPolicy::AddressPolicy(const Config& cfg, Resolver resolver)
    : allowDirectIp_(cfg.allowDirectIp),
      ipDeny_(ParseMasks(cfg.ipDenyList, "ip deny list")),
      domainAllow_(cfg.domainAllowList),
      domainDeny_(cfg.domainDenyList),
      resolver_(std::move(resolver)) {
    if (cfg.ipAllowList) ipAllow_ = ParseMasks(*cfg.ipAllowList, "ip allow list");
    if (!resolver_) throw std::invalid_argument("AddressPolicy requires a resolver");
}

std::string AddressPolicy::NormalizeHostname(const std::string& host) {
    std::string out;
    out.reserve(host.size());
    for (unsigned char c : host) out.push_back(static_cast<char>(std::tolower(c)));
    if (out.size() > 1 && out.back() == '.') out.pop_back();
    return out;
}

bool AddressPolicy::IsIpLiteral(const std::string& host) {
    IpAddress ip;
    return IpAddress::Parse(host, &ip) || CanonicalizeNumericHost(host, nullptr) != NumericHost::kName;
}

bool AddressPolicy::IsIpAllowed(const std::string& ip) const {
    IpAddress addr;
    if (!IpAddress::Parse(ip, &addr)) return false;

    for (const auto& m : ipDeny_) {
        if (m.Contains(addr)) return false;
    }
    if (!ipAllow_) return true;
    for (const auto& m : *ipAllow_) {
        if (m.Contains(addr)) return true;
    }
    return false;
}

bool AddressPolicy::IsDomainAllowed(const std::string& domain) const {
    for (const auto& p : domainDeny_) {
        if (p.Matches(domain)) return false;
    }
    if (!domainAllow_) return true;
    for (const auto& p : *domainAllow_) {
        if (p.Matches(domain)) return true;
    }
    return false;
}

std::vector<std::string> AddressPolicy::Resolve(const std::string& hostname) const {
    std::string host = NormalizeHostname(hostname);
    if (host.empty()) return {};

    std::string dotted;
    const NumericHost numeric = CanonicalizeNumericHost(host, &dotted);
    if (numeric == NumericHost::kInvalid) {
        LOG_DEBUG << "AddressPolicy: malformed numeric host " << host;
        return {};
    }
    if (numeric == NumericHost::kIpv4) host = dotted;

    if (IsIpLiteral(host)) {
        if (!allowDirectIp_) {
            LOG_DEBUG << "AddressPolicy: direct ip " << host << " not allowed";
            return {};
        }
        if (!IsIpAllowed(host)) return {};
        return {host};
    }

    if (!IsDomainAllowed(host)) {
        LOG_DEBUG << "AddressPolicy: domain " << host << " rejected by domain lists";
        return {};
    }

    std::vector<std::string> addresses = resolver_(host);
    if (addresses.empty()) {
        LOG_DEBUG << "AddressPolicy: " << host << " resolved to no addresses";
        return {};
    }
    for (const auto& ip : addresses) {
        if (!IsIpAllowed(ip)) {
            LOG_DEBUG << "AddressPolicy: " << host << " resolved to blocked address " << ip;
            return {};
        }
    }
    return addresses;
}

bool AddressPolicy::IsHostnameAllowed(const std::string& hostname) const {
    return !Resolve(hostname).empty();
}

} // namespace policy
} // namespace egress
