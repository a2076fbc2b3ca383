#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "egress/admission/AdmissionController.h"
#include "egress/common/TimerQueue.h"
#include "egress/common/noncopyable.h"
#include "egress/fetch/FetchTypes.h"
#include "egress/fetch/Lifecycle.h"
#include "egress/fetch/Url.h"
#include "egress/policy/AddressPolicy.h"

namespace egress {
namespace fetch {

using StaticHeaderProvider = std::function<HeaderMap()>;

// Runs one Fetch call end to end: admission, destination policy, transport
// under a cancellation token, content-length cap and body shaping.
// The permit, the token registration and the timeout timer are all released on
// every exit path.
class RequestExecutor : common::noncopyable {
public:
    struct Options {
        std::optional<std::uint64_t> maxContentLength;
        HeaderMap staticHeaders;
        StaticHeaderProvider staticHeaderProvider;
    };

    // All collaborators must outlive the executor.
    RequestExecutor(Options opts,
                    Lifecycle* lifecycle,
                    admission::AdmissionController* admission,
                    const policy::AddressPolicy* policy,
                    Transport transport,
                    common::TimerQueue* timers);

    // Throws FetchError.
    FetchResult Execute(const std::string& url, const FetchParams& params);

    // Caller headers, overridden case-insensitively by the static map and then
    // by the provider. Throws FetchError(kInvalidArgument) on malformed headers.
    HeaderMap MergeHeaders(const HeaderMap& caller) const;

    // Throws FetchError(kContentLengthExceeded) unless a well-formed
    // content-length header is present and neither it nor `actualSize` exceeds `cap`.
    static void CheckContentLength(const HeaderMap& headers, std::size_t actualSize, std::uint64_t cap);

    // Uppercases standard methods; rejects forbidden and malformed ones.
    static std::string NormalizeMethod(const std::string& method);

private:
    TransportRequest BuildRequest(const Url& url, std::vector<std::string> addresses, const FetchParams& params) const;

    const Options opts_;
    Lifecycle* lifecycle_;
    admission::AdmissionController* admission_;
    const policy::AddressPolicy* policy_;
    Transport transport_;
    common::TimerQueue* timers_;
};

} // namespace fetch
} // namespace egress
