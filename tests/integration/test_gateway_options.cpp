#include "egress/Gateway.h"
#include "egress/GatewayOptions.h"
#include "egress/common/Config.h"
#include "egress/common/Logger.h"
#include "support/MockNetwork.h"

#include <cassert>
#include <memory>
#include <string>

using egress::FetchError;
using egress::Gateway;
using egress::GatewayOptions;
using egress::LoadGatewayOptions;
using egress::common::Config;
using egress::common::Logger;

static bool load(const std::string& ini, GatewayOptions* out, std::string* error) {
    Config cfg;
    assert(cfg.LoadFromString(ini));
    return LoadGatewayOptions(cfg, out, error);
}

static void testFullConfig() {
    const std::string ini =
        "[admission]\n"
        "rate_window_ms = 1000\n"
        "rate_quota = 20\n"
        "max_active = 4\n"
        "max_awaiting = 16\n"
        "[policy]\n"
        "allow_direct_ip = yes\n"
        "ip_allow = 10.0.0.0/8, 192.168.1.0/24\n"
        "ip_deny = 10.0.0.0/24\n"
        "domain_allow = api.example.com, /\\.internal$/\n"
        "domain_deny = /^admin\\./\n"
        "[response]\n"
        "max_content_length = 1048576\n"
        "[headers]\n"
        "Authorization = Bearer abc\n"
        "X-Tenant = t1\n"
        "[transport]\n"
        "connect_timeout_ms = 2500\n"
        "io_timeout_ms = 7000\n"
        "verify_peer = false\n"
        "ca_file = /etc/ssl/custom.pem\n"
        "user_agent = tenant-agent/2\n";

    GatewayOptions o;
    std::string error;
    assert(load(ini, &o, &error));
    assert(error.empty());
    assert(o.rateWindow.count() == 1000);
    assert(o.rateQuota == 20);
    assert(o.maxActiveCount == 4);
    assert(o.maxAwaitingCount == 16);
    assert(o.allowDirectIp);
    assert(o.ipAllowList && o.ipAllowList->size() == 2);
    assert((*o.ipAllowList)[1] == "192.168.1.0/24");
    assert(o.ipDenyList.size() == 1);
    assert(o.domainAllowList && o.domainAllowList->size() == 2);
    assert(!(*o.domainAllowList)[0].isRegex());
    assert((*o.domainAllowList)[0].source() == "api.example.com");
    assert((*o.domainAllowList)[1].isRegex());
    assert((*o.domainAllowList)[1].Matches("db.internal"));
    assert(o.domainDenyList.size() == 1 && o.domainDenyList[0].Matches("admin.example.com"));
    assert(o.maxContentLength && *o.maxContentLength == 1048576);
    assert(*egress::FindHeader(o.staticHeaders, "authorization") == "Bearer abc");
    assert(*egress::FindHeader(o.staticHeaders, "x-tenant") == "t1");
    assert(o.http.connectTimeout.count() == 2500);
    assert(o.http.ioTimeout.count() == 7000);
    assert(!o.http.verifyPeer);
    assert(o.http.caFile == "/etc/ssl/custom.pem");
    assert(o.http.userAgent == "tenant-agent/2");
}

static void testDefaultsKept() {
    GatewayOptions o;
    o.maxActiveCount = 7;
    std::string error;
    assert(load("[policy]\nip_deny = 127.0.0.0/8\n", &o, &error));
    assert(o.maxActiveCount == 7);
    assert(!o.ipAllowList);
    assert(!o.domainAllowList);
    assert(!o.maxContentLength);
    assert(o.http.verifyPeer);
    assert(o.http.userAgent == "egress/1.0");
}

// A present but empty allow list rejects everything.
static void testEmptyAllowList() {
    GatewayOptions o;
    std::string error;
    assert(load("[policy]\nip_allow =\n", &o, &error));
    assert(o.ipAllowList && o.ipAllowList->empty());

    auto mock = std::make_shared<egress::testing::MockTransport>();
    o.resolver = &egress::testing::MockResolve;
    o.transport = egress::testing::MakeTransport(mock);
    Gateway gw(o);
    try {
        gw.Fetch("http://_8.8.8.8_/");
        assert(false && "empty allow list should block");
    } catch (const FetchError& e) {
        assert(e.kind() == FetchError::Kind::kAddressBlocked);
    }
}

static void testErrors() {
    const char* bad[] = {
        "[admission]\nmax_active = -1\n",
        "[admission]\nmax_active = lots\n",
        "[admission]\nrate_window_ms = 100\n",
        "[policy]\nallow_direct_ip = maybe\n",
        "[policy]\nip_deny = 10.0.0.0/33\n",
        "[policy]\nip_allow = not-an-ip\n",
        "[policy]\ndomain_deny = /([/\n",
        "[response]\nmax_content_length = -5\n",
        "[transport]\nio_timeout_ms = 0\n",
    };
    for (const char* ini : bad) {
        GatewayOptions o;
        o.maxActiveCount = 3;
        std::string error;
        assert(!load(ini, &o, &error));
        assert(!error.empty());
        assert(o.maxActiveCount == 3);
    }
}

int main() {
    Logger::Instance().SetLevel(egress::common::LogLevel::ERROR);
    testFullConfig();
    testDefaultsKept();
    testEmptyAllowList();
    testErrors();
    return 0;
}
