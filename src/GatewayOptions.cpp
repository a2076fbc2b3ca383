#include "egress/GatewayOptions.h"
#include "egress/policy/IpMask.h"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace egress {

namespace {

bool fail(std::string* error, const std::string& msg) {
    if (error) *error = msg;
    return false;
}

// Absent keys leave *out alone; present keys must be whole integers >= 0.
bool ReadCount(const common::Config& cfg, const char* section, const char* key, int64_t* out, std::string* error) {
    if (!cfg.HasKey(section, key)) return true;
    const std::string v = cfg.GetString(section, key);
    if (v.empty()) return fail(error, std::string("[") + section + "] " + key + " is empty");
    errno = 0;
    char* end = nullptr;
    const long long n = std::strtoll(v.c_str(), &end, 10);
    if (errno != 0 || end == v.c_str() || *end != '\0' || n < 0) {
        return fail(error, std::string("[") + section + "] " + key + " must be a non-negative integer, got '" + v + "'");
    }
    *out = n;
    return true;
}

bool ReadBool(const common::Config& cfg, const char* section, const char* key, bool* out, std::string* error) {
    if (!cfg.HasKey(section, key)) return true;
    const std::string v = cfg.GetString(section, key);
    const bool t = cfg.GetBool(section, key, false);
    const bool f = !cfg.GetBool(section, key, true);
    if (t == f) return fail(error, std::string("[") + section + "] " + key + " must be a boolean, got '" + v + "'");
    *out = t;
    return true;
}

bool ReadCidrs(const common::Config& cfg, const char* key, std::vector<std::string>* out, std::string* error) {
    std::vector<std::string> list = cfg.GetList("policy", key);
    for (const auto& c : list) {
        policy::IpMask m;
        if (!policy::IpMask::Parse(c, &m)) return fail(error, std::string("[policy] ") + key + ": invalid CIDR '" + c + "'");
    }
    *out = std::move(list);
    return true;
}

bool ReadDomains(const common::Config& cfg, const char* key, std::vector<policy::DomainPattern>* out, std::string* error) {
    std::vector<policy::DomainPattern> patterns;
    for (const auto& text : cfg.GetList("policy", key)) {
        try {
            patterns.push_back(policy::DomainPattern::Parse(text));
        } catch (const std::invalid_argument& e) {
            return fail(error, std::string("[policy] ") + key + ": " + e.what());
        }
    }
    *out = std::move(patterns);
    return true;
}

} // namespace

bool LoadGatewayOptions(const common::Config& config, GatewayOptions* out, std::string* error) {
    if (!out) return fail(error, "no output");
    GatewayOptions opts = *out;

    int64_t windowMs = opts.rateWindow.count();
    if (!ReadCount(config, "admission", "rate_window_ms", &windowMs, error)) return false;
    opts.rateWindow = std::chrono::milliseconds(windowMs);
    if (!ReadCount(config, "admission", "rate_quota", &opts.rateQuota, error)) return false;
    if (!ReadCount(config, "admission", "max_active", &opts.maxActiveCount, error)) return false;
    if (!ReadCount(config, "admission", "max_awaiting", &opts.maxAwaitingCount, error)) return false;
    if (opts.rateWindow.count() > 0 && opts.rateQuota <= 0) {
        return fail(error, "[admission] rate_quota must be > 0 when rate_window_ms is set");
    }

    if (!ReadBool(config, "policy", "allow_direct_ip", &opts.allowDirectIp, error)) return false;
    if (config.HasKey("policy", "ip_allow")) {
        std::vector<std::string> allow;
        if (!ReadCidrs(config, "ip_allow", &allow, error)) return false;
        opts.ipAllowList = std::move(allow);
    }
    if (config.HasKey("policy", "ip_deny") && !ReadCidrs(config, "ip_deny", &opts.ipDenyList, error)) return false;
    if (config.HasKey("policy", "domain_allow")) {
        std::vector<policy::DomainPattern> allow;
        if (!ReadDomains(config, "domain_allow", &allow, error)) return false;
        opts.domainAllowList = std::move(allow);
    }
    if (config.HasKey("policy", "domain_deny") && !ReadDomains(config, "domain_deny", &opts.domainDenyList, error)) {
        return false;
    }

    if (config.HasKey("response", "max_content_length")) {
        int64_t cap = 0;
        if (!ReadCount(config, "response", "max_content_length", &cap, error)) return false;
        opts.maxContentLength = static_cast<std::uint64_t>(cap);
    }

    for (const auto& kv : config.GetSection("headers")) {
        SetHeader(&opts.staticHeaders, kv.first, kv.second);
    }

    int64_t connectMs = opts.http.connectTimeout.count();
    if (!ReadCount(config, "transport", "connect_timeout_ms", &connectMs, error)) return false;
    int64_t ioMs = opts.http.ioTimeout.count();
    if (!ReadCount(config, "transport", "io_timeout_ms", &ioMs, error)) return false;
    if (connectMs == 0 || ioMs == 0) return fail(error, "[transport] timeouts must be > 0");
    opts.http.connectTimeout = std::chrono::milliseconds(connectMs);
    opts.http.ioTimeout = std::chrono::milliseconds(ioMs);
    if (!ReadBool(config, "transport", "verify_peer", &opts.http.verifyPeer, error)) return false;
    if (config.HasKey("transport", "ca_file")) opts.http.caFile = config.GetString("transport", "ca_file");
    if (config.HasKey("transport", "user_agent")) opts.http.userAgent = config.GetString("transport", "user_agent");

    *out = std::move(opts);
    return true;
}

} // namespace egress
