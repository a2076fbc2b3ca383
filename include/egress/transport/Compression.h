#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace egress {
namespace transport {

// Content-Encoding codecs backed by zlib.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    // Reads a Content-Encoding value. Stacked encodings are not supported and
    // report kUnknown.
    static Encoding ParseContentEncoding(const std::string& v);
    static const char* EncodingName(Encoding enc);

    // Whole-buffer inflate. `limit` caps the decoded size; going over it fails
    // and leaves `out` holding more than `limit` bytes.
    static bool Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out,
                           std::optional<size_t> limit = std::nullopt);
    static bool Decompress(Encoding enc, const std::string& in, std::string* out,
                           std::optional<size_t> limit = std::nullopt);

    static bool Compress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace transport
} // namespace egress
