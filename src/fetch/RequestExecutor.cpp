#include "egress/fetch/RequestExecutor.h"
#include "egress/common/Logger.h"
#include "egress/fetch/FetchError.h"
#include "egress/fetch/Multipart.h"
#include "egress/fetch/ResponseShaper.h"

#include <cctype>
#include <memory>
#include <stdexcept>

namespace egress {
namespace fetch {

namespace {

// Cancels the request token with CancelReason::kTimeout unless disarmed first.
class TimeoutGuard : common::noncopyable {
public:
    TimeoutGuard(common::TimerQueue* timers,
                 const std::optional<std::chrono::milliseconds>& timeout,
                 const CancellationTokenPtr& token)
        : timers_(timers) {
        if (!timers_ || !timeout) return;
        std::weak_ptr<CancellationToken> weak = token;
        id_ = timers_->RunAfter(*timeout, [weak]() {
            if (auto t = weak.lock()) {
                if (t->Cancel(CancelReason::kTimeout)) LOG_DEBUG << "request timed out";
            }
        });
    }

    ~TimeoutGuard() { Disarm(); }

    void Disarm() {
        if (id_ != 0) {
            timers_->Cancel(id_);
            id_ = 0;
        }
    }

private:
    common::TimerQueue* timers_;
    common::TimerQueue::TimerId id_{0};
};

bool IsTokenChar(unsigned char c) {
    if (std::isalnum(c)) return true;
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

bool IsToken(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!IsTokenChar(c)) return false;
    }
    return true;
}

void ValidateHeader(const std::string& name, const std::string& value) {
    if (!IsToken(name)) {
        throw FetchError(FetchError::Kind::kInvalidArgument, "invalid header name '" + name + "'");
    }
    if (value.find_first_of("\r\n") != std::string::npos || value.find('\0') != std::string::npos) {
        throw FetchError(FetchError::Kind::kInvalidArgument, "invalid value for header '" + name + "'");
    }
}

std::string Trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

} // namespace

RequestExecutor::RequestExecutor(Options opts,
                                 Lifecycle* lifecycle,
                                 admission::AdmissionController* admission,
                                 const policy::AddressPolicy* policy,
                                 Transport transport,
                                 common::TimerQueue* timers)
    : opts_(std::move(opts)),
      lifecycle_(lifecycle),
      admission_(admission),
      policy_(policy),
      transport_(std::move(transport)),
      timers_(timers) {
    if (!lifecycle_ || !admission_ || !policy_ || !timers_) {
        throw std::invalid_argument("RequestExecutor: missing collaborator");
    }
    if (!transport_) throw std::invalid_argument("RequestExecutor: missing transport");
}

std::string RequestExecutor::NormalizeMethod(const std::string& method) {
    if (method.empty()) return "GET";
    if (!IsToken(method)) {
        throw FetchError(FetchError::Kind::kInvalidArgument, "invalid method '" + method + "'");
    }
    std::string upper;
    upper.reserve(method.size());
    for (unsigned char c : method) upper.push_back(static_cast<char>(std::toupper(c)));

    if (upper == "CONNECT" || upper == "TRACE" || upper == "TRACK") {
        throw FetchError(FetchError::Kind::kInvalidArgument, "forbidden method '" + method + "'");
    }
    static const char* const kStandard[] = {"DELETE", "GET", "HEAD", "OPTIONS", "POST", "PUT", "PATCH"};
    for (const char* m : kStandard) {
        if (upper == m) return upper;
    }
    return method;
}

HeaderMap RequestExecutor::MergeHeaders(const HeaderMap& caller) const {
    HeaderMap merged;
    for (const auto& kv : caller) {
        ValidateHeader(kv.first, kv.second);
        SetHeader(&merged, kv.first, kv.second);
    }
    for (const auto& kv : opts_.staticHeaders) {
        ValidateHeader(kv.first, kv.second);
        SetHeader(&merged, kv.first, kv.second);
    }
    if (opts_.staticHeaderProvider) {
        HeaderMap dynamic;
        try {
            dynamic = opts_.staticHeaderProvider();
        } catch (const std::exception& e) {
            throw FetchError(FetchError::Kind::kInvalidArgument, std::string("static header provider failed: ") + e.what());
        }
        for (const auto& kv : dynamic) {
            ValidateHeader(kv.first, kv.second);
            SetHeader(&merged, kv.first, kv.second);
        }
    }
    return merged;
}

void RequestExecutor::CheckContentLength(const HeaderMap& headers, std::size_t actualSize, std::uint64_t cap) {
    const std::string* header = FindHeader(headers, "content-length");
    if (!header) {
        throw FetchError(FetchError::Kind::kContentLengthExceeded, "fetch content length: missing content-length");
    }
    const std::string value = Trim(*header);
    if (value.empty() || value.size() > 19) {
        throw FetchError(FetchError::Kind::kContentLengthExceeded, "fetch content length: invalid content-length '" + *header + "'");
    }
    std::uint64_t declared = 0;
    for (char c : value) {
        if (c < '0' || c > '9') {
            throw FetchError(FetchError::Kind::kContentLengthExceeded, "fetch content length: invalid content-length '" + *header + "'");
        }
        declared = declared * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (declared > cap) {
        throw FetchError(FetchError::Kind::kContentLengthExceeded,
                         "fetch content length: " + value + " exceeds limit " + std::to_string(cap));
    }
    if (actualSize > cap) {
        throw FetchError(FetchError::Kind::kContentLengthExceeded,
                         "fetch content length: body of " + std::to_string(actualSize) + " bytes exceeds limit " +
                             std::to_string(cap));
    }
}

TransportRequest RequestExecutor::BuildRequest(const Url& url, std::vector<std::string> addresses, const FetchParams& params) const {
    TransportRequest req;
    req.url = url.ToString();
    req.scheme = url.scheme;
    req.host = url.host;
    req.port = url.port;
    req.target = url.target;
    req.addresses = std::move(addresses);
    req.method = NormalizeMethod(params.method);
    req.headers = MergeHeaders(params.headers);
    req.redirect = params.redirect;
    req.credentials = params.credentials;
    req.mode = params.mode;
    req.referrer = params.referrer;
    req.referrerPolicy = params.referrerPolicy;
    req.maxContentLength = opts_.maxContentLength;

    const bool hasBody = !std::holds_alternative<std::monostate>(params.body);
    if (hasBody && (req.method == "GET" || req.method == "HEAD")) {
        throw FetchError(FetchError::Kind::kInvalidArgument, "request with " + req.method + " method cannot have a body");
    }

    if (const auto* text = std::get_if<std::string>(&params.body)) {
        req.body = *text;
        if (!FindHeader(req.headers, "content-type")) SetHeader(&req.headers, "Content-Type", "text/plain;charset=UTF-8");
    } else if (const auto* bytes = std::get_if<Bytes>(&params.body)) {
        req.body.assign(bytes->begin(), bytes->end());
    } else if (const auto* form = std::get_if<FormData>(&params.body)) {
        const std::string boundary = Multipart::MakeBoundary();
        req.body = Multipart::Encode(*form, boundary);
        // The boundary is ours, so our Content-Type wins over a caller's.
        SetHeader(&req.headers, "Content-Type", Multipart::ContentType(boundary));
    }
    return req;
}

FetchResult RequestExecutor::Execute(const std::string& url, const FetchParams& params) {
    lifecycle_->ThrowIfDisposed();
    if (params.timeout && params.timeout->count() < 0) {
        throw FetchError(FetchError::Kind::kInvalidArgument, "timeout must be >= 0");
    }

    admission::AdmissionController::Permit permit = admission_->Acquire();
    lifecycle_->ThrowIfDisposed();

    auto token = std::make_shared<CancellationToken>();
    Lifecycle::Registration registration = lifecycle_->Track(token);

    Url target;
    std::string error;
    if (!Url::Parse(url, &target, &error)) {
        throw FetchError(FetchError::Kind::kInvalidArgument, "invalid url '" + url + "': " + error);
    }
    LOG_DEBUG << "fetch " << target.ToString();

    std::vector<std::string> addresses;
    try {
        addresses = policy_->Resolve(target.host);
    } catch (const std::exception& e) {
        LOG_WARN << "resolve " << target.host << " failed: " << e.what();
        throw FetchError(FetchError::Kind::kAddressBlocked, std::string("resolve failed: ") + e.what());
    }
    lifecycle_->ThrowIfDisposed();
    if (addresses.empty()) {
        LOG_WARN << "blocked destination " << target.host;
        throw FetchError(FetchError::Kind::kAddressBlocked, "address blocked");
    }

    TransportRequest request = BuildRequest(target, std::move(addresses), params);

    TransportResponse response;
    {
        TimeoutGuard timeout(timers_, params.timeout, token);
        try {
            response = transport_(request, token);
        } catch (const std::exception& e) {
            const CancelReason reason = token->reason();
            if (reason != CancelReason::kNone) {
                LOG_WARN << request.method << " " << request.url << " aborted (" << CancelReasonName(reason) << ")";
                throw FetchError(FetchError::Kind::kTransportFailure,
                                 std::string("request aborted: ") + CancelReasonName(reason), reason);
            }
            if (const auto* fe = dynamic_cast<const FetchError*>(&e)) {
                LOG_WARN << request.method << " " << request.url << " failed: " << fe->what();
                throw;
            }
            LOG_WARN << request.method << " " << request.url << " failed: " << e.what();
            throw FetchError(FetchError::Kind::kTransportFailure, std::string("transport failed: ") + e.what());
        }
        timeout.Disarm();
    }

    lifecycle_->ThrowIfDisposed();
    if (token->cancelled()) {
        const CancelReason reason = token->reason();
        LOG_WARN << request.method << " " << request.url << " aborted (" << CancelReasonName(reason) << ")";
        throw FetchError(FetchError::Kind::kTransportFailure, std::string("request aborted: ") + CancelReasonName(reason), reason);
    }

    if (opts_.maxContentLength) {
        try {
            CheckContentLength(response.headers, response.body.size(), *opts_.maxContentLength);
        } catch (const FetchError& e) {
            LOG_WARN << request.url << ": " << e.what();
            throw;
        }
    }

    const BodyType bodyType = ResponseShaper::Negotiate(params.type, FindHeader(response.headers, "content-type"));
    ResponseBody body = ResponseShaper::Shape(bodyType, response);
    lifecycle_->ThrowIfDisposed();

    FetchResult result;
    result.url = response.url.empty() ? request.url : response.url;
    result.status = response.status;
    result.ok = response.status >= 200 && response.status <= 299;
    result.statusText = response.statusText;
    result.redirected = response.redirected;
    result.type = response.type;
    result.headers = std::move(response.headers);
    result.bodyType = bodyType;
    result.body = std::move(body);
    LOG_DEBUG << "fetch " << result.url << " -> " << result.status << " as " << BodyTypeName(bodyType);
    return result;
}

} // namespace fetch
} // namespace egress
