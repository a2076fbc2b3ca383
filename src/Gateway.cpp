#include "egress/Gateway.h"
#include "egress/common/Logger.h"
#include "egress/transport/HttpTransport.h"

namespace egress {

static policy::AddressPolicy::Config PolicyConfig(const GatewayOptions& o) {
    policy::AddressPolicy::Config cfg;
    cfg.allowDirectIp = o.allowDirectIp;
    cfg.ipAllowList = o.ipAllowList;
    cfg.ipDenyList = o.ipDenyList;
    cfg.domainAllowList = o.domainAllowList;
    cfg.domainDenyList = o.domainDenyList;
    return cfg;
}

static admission::AdmissionController::Config AdmissionConfig(const GatewayOptions& o) {
    admission::AdmissionController::Config cfg;
    cfg.rateWindow = o.rateWindow;
    cfg.rateQuota = o.rateQuota;
    cfg.maxActive = o.maxActiveCount;
    cfg.maxAwaiting = o.maxAwaitingCount;
    return cfg;
}

static fetch::RequestExecutor::Options ExecutorOptions(const GatewayOptions& o) {
    fetch::RequestExecutor::Options opts;
    opts.maxContentLength = o.maxContentLength;
    opts.staticHeaders = o.staticHeaders;
    opts.staticHeaderProvider = o.staticHeaderProvider;
    return opts;
}

Gateway::Gateway(GatewayOptions options)
    : timers_("egress-timer"),
      policy_(PolicyConfig(options), options.resolver ? options.resolver : policy::SystemResolver()),
      admission_(AdmissionConfig(options), &timers_),
      executor_(ExecutorOptions(options),
                &lifecycle_,
                &admission_,
                &policy_,
                options.transport ? options.transport : Transport(transport::HttpTransport(options.http)),
                &timers_) {
    LOG_DEBUG << "gateway created: rateWindow=" << options.rateWindow.count() << "ms rateQuota=" << options.rateQuota
              << " maxActive=" << options.maxActiveCount << " maxAwaiting=" << options.maxAwaitingCount;
}

Gateway::~Gateway() {
    Dispose();
    admission_.WaitIdle();
    timers_.Stop();
}

FetchResult Gateway::Fetch(const std::string& url, const FetchParams& params) {
    return executor_.Execute(url, params);
}

void Gateway::Dispose() {
    const std::size_t live = lifecycle_.inFlight();
    const bool first = lifecycle_.Dispose();
    admission_.Dispose();
    if (first) {
        const auto s = admission_.snapshot();
        LOG_INFO << "gateway disposed: in-flight=" << live << " awaiting=" << s.awaiting;
    }
}

} // namespace egress
