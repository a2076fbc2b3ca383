#pragma once

#include <string>

#include "egress/fetch/FetchTypes.h"

namespace egress {
namespace fetch {

// multipart/form-data and application/x-www-form-urlencoded codecs.
class Multipart {
public:
    // Random boundary suitable for a request body.
    static std::string MakeBoundary();

    // "multipart/form-data; boundary=<boundary>"
    static std::string ContentType(const std::string& boundary);

    static std::string Encode(const FormData& form, const std::string& boundary);

    // Reads the boundary parameter of a Content-Type value.
    static bool ExtractBoundary(const std::string& contentType, std::string* boundary);

    // Parts with a filename become FileBlob entries stamped with `lastModified`.
    static bool Decode(const std::string& body, const std::string& boundary,
                       std::int64_t lastModified, FormData* out);

    static bool DecodeUrlEncoded(const std::string& body, FormData* out);
};

} // namespace fetch
} // namespace egress
