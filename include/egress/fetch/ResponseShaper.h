#pragma once

#include <optional>
#include <string>

#include "egress/fetch/FetchTypes.h"

namespace egress {
namespace fetch {

// Chooses and produces the representation of a response body.
class ResponseShaper {
public:
    // An explicit request wins; otherwise infer from the Content-Type value
    // (nullptr when the header is absent).
    static BodyType Negotiate(const std::optional<BodyType>& requested, const std::string* contentType);

    // Throws FetchError(kResponseFormat) when the body does not fit `type`.
    static ResponseBody Shape(BodyType type, const TransportResponse& response);
};

} // namespace fetch
} // namespace egress
