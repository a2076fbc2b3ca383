#include "egress/fetch/ResponseShaper.h"
#include "egress/fetch/FetchError.h"
#include "egress/fetch/Multipart.h"

#include <cctype>
#include <chrono>
#include <memory>
#include <sstream>

namespace egress {
namespace fetch {

static std::string ToLowerTrimmed(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    std::string out;
    out.reserve(j - i);
    for (size_t k = i; k < j; ++k) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[k]))));
    return out;
}

static bool StartsWith(const std::string& s, const std::string& p) {
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}

BodyType ResponseShaper::Negotiate(const std::optional<BodyType>& requested, const std::string* contentType) {
    if (requested) return *requested;
    if (!contentType) return BodyType::kText;

    const std::string ct = ToLowerTrimmed(*contentType);
    if (StartsWith(ct, "application/json")) return BodyType::kJson;
    if (StartsWith(ct, "multipart/form-data")) return BodyType::kFormData;
    if (ct == "text" || StartsWith(ct, "text/") || ct.find("+xml") != std::string::npos) return BodyType::kText;
    return BodyType::kArrayBuffer;
}

static Json::Value ParseJson(const std::string& body) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    builder["failIfExtra"] = true;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errs;
    if (body.empty() || !reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
        throw FetchError(FetchError::Kind::kResponseFormat, "invalid json body: " + (body.empty() ? std::string("empty body") : errs));
    }
    return root;
}

static FormData ParseForm(const TransportResponse& response) {
    const std::string* ctHeader = FindHeader(response.headers, "content-type");
    const std::string ct = ctHeader ? ToLowerTrimmed(*ctHeader) : std::string();

    FormData form;
    if (StartsWith(ct, "multipart/form-data")) {
        std::string boundary;
        if (!Multipart::ExtractBoundary(*ctHeader, &boundary)) {
            throw FetchError(FetchError::Kind::kResponseFormat, "multipart body without boundary");
        }
        const std::int64_t now = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count();
        if (!Multipart::Decode(response.body, boundary, now, &form)) {
            throw FetchError(FetchError::Kind::kResponseFormat, "malformed multipart body");
        }
        return form;
    }
    if (StartsWith(ct, "application/x-www-form-urlencoded")) {
        Multipart::DecodeUrlEncoded(response.body, &form);
        return form;
    }
    throw FetchError(FetchError::Kind::kResponseFormat, "response is not form data: '" + ct + "'");
}

ResponseBody ResponseShaper::Shape(BodyType type, const TransportResponse& response) {
    switch (type) {
        case BodyType::kText:
            return response.body;
        case BodyType::kArrayBuffer:
            return Bytes(response.body.begin(), response.body.end());
        case BodyType::kJson:
            return ParseJson(response.body);
        case BodyType::kFormData:
            return ParseForm(response);
    }
    return response.body;
}

} // namespace fetch
} // namespace egress
