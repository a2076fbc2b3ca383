#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "egress/common/Config.h"
#include "egress/fetch/FetchTypes.h"
#include "egress/fetch/RequestExecutor.h"
#include "egress/policy/DomainPattern.h"
#include "egress/policy/Resolver.h"
#include "egress/transport/HttpTransport.h"

namespace egress {

struct GatewayOptions {
    // Rate pool: at most rateQuota admissions per rateWindow. 0 disables it.
    std::chrono::milliseconds rateWindow{0};
    int64_t rateQuota{0};
    int64_t maxActiveCount{0};   // 0 means unlimited
    int64_t maxAwaitingCount{0}; // 0 rejects every call that would have to wait

    bool allowDirectIp{false};
    std::optional<std::vector<std::string>> ipAllowList; // CIDR strings
    std::vector<std::string> ipDenyList;
    std::optional<std::vector<policy::DomainPattern>> domainAllowList;
    std::vector<policy::DomainPattern> domainDenyList;

    std::optional<std::uint64_t> maxContentLength;

    HeaderMap staticHeaders;
    fetch::StaticHeaderProvider staticHeaderProvider;

    // Empty members fall back to HttpTransport(http) and SystemResolver().
    Transport transport;
    policy::Resolver resolver;
    transport::HttpTransport::Options http;
};

// Reads the [admission], [policy], [response], [headers] and [transport]
// sections. Keys that are absent keep the values already in `out`. On failure
// returns false with a message in `error` and leaves `out` untouched.
bool LoadGatewayOptions(const common::Config& config, GatewayOptions* out, std::string* error);

} // namespace egress
