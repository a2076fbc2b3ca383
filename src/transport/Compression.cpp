#include "egress/transport/Compression.h"

#include <cctype>
#include <cstring>

#include <zlib.h>

namespace egress {
namespace transport {

static std::string TrimLower(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    size_t j = s.size();
    while (j > i && (s[j - 1] == ' ' || s[j - 1] == '\t')) --j;
    std::string out;
    out.reserve(j - i);
    for (size_t k = i; k < j; ++k) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[k]))));
    return out;
}

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = TrimLower(v);
    if (lv.empty() || lv == "identity") return Encoding::kIdentity;
    if (lv == "gzip" || lv == "x-gzip") return Encoding::kGzip;
    if (lv == "deflate") return Encoding::kDeflate;
    return Encoding::kUnknown;
}

const char* Compression::EncodingName(Encoding enc) {
    switch (enc) {
        case Encoding::kIdentity: return "identity";
        case Encoding::kGzip: return "gzip";
        case Encoding::kDeflate: return "deflate";
        case Encoding::kUnknown: return "unknown";
    }
    return "unknown";
}

enum class InflateResult { kOk, kFormat, kLimit };

// On kLimit `out` keeps the bytes decoded so far, already past the limit.
static InflateResult InflateAll(const uint8_t* data, size_t len, int windowBits, std::optional<size_t> limit,
                                std::string* out) {
    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    zs.avail_in = static_cast<uInt>(len);
    if (inflateInit2(&zs, windowBits) != Z_OK) return InflateResult::kFormat;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&zs);
            return InflateResult::kFormat;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
        if (limit && out->size() > *limit) {
            inflateEnd(&zs);
            return InflateResult::kLimit;
        }
        // Truncated input: no progress possible.
        if (ret == Z_OK && produced == 0 && zs.avail_in == 0) {
            inflateEnd(&zs);
            return InflateResult::kFormat;
        }
    }
    inflateEnd(&zs);
    return InflateResult::kOk;
}

bool Compression::Decompress(Encoding enc, const uint8_t* data, size_t len, std::string* out,
                             std::optional<size_t> limit) {
    if (!out) return false;
    switch (enc) {
        case Encoding::kIdentity:
            out->assign(reinterpret_cast<const char*>(data), len);
            return !limit || out->size() <= *limit;
        case Encoding::kGzip:
            return InflateAll(data, len, 16 + MAX_WBITS, limit, out) == InflateResult::kOk;
        case Encoding::kDeflate: {
            // zlib-wrapped per RFC 9110; some servers send raw deflate.
            const InflateResult wrapped = InflateAll(data, len, MAX_WBITS, limit, out);
            if (wrapped != InflateResult::kFormat) return wrapped == InflateResult::kOk;
            return InflateAll(data, len, -MAX_WBITS, limit, out) == InflateResult::kOk;
        }
        case Encoding::kUnknown:
            break;
    }
    return false;
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out, std::optional<size_t> limit) {
    return Decompress(enc, reinterpret_cast<const uint8_t*>(in.data()), in.size(), out, limit);
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    if (!out) return false;
    if (enc == Encoding::kIdentity) {
        *out = in;
        return true;
    }
    if (enc != Encoding::kGzip && enc != Encoding::kDeflate) return false;

    out->clear();
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    const int windowBits = (enc == Encoding::kGzip) ? 16 + MAX_WBITS : MAX_WBITS;
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) return false;

    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);
        ret = deflate(&zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            deflateEnd(&zs);
            return false;
        }
        const size_t produced = sizeof(buf) - zs.avail_out;
        if (produced) out->append(buf, buf + produced);
    }
    deflateEnd(&zs);
    return true;
}

} // namespace transport
} // namespace egress
