#include "egress/fetch/Url.h"
#include "egress/policy/IpMask.h"

#include <cctype>

namespace egress {
namespace fetch {

static bool fail(std::string* error, const char* msg) {
    if (error) *error = msg;
    return false;
}

static std::string ToLowerCopy(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

static bool IsHostChar(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_';
}

bool Url::Parse(const std::string& text, Url* out, std::string* error) {
    if (!out) return false;

    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    const std::string s = text.substr(start, end - start);

    const size_t schemeEnd = s.find("://");
    if (schemeEnd == std::string::npos) return fail(error, "missing scheme");
    Url u;
    u.scheme = ToLowerCopy(s.substr(0, schemeEnd));
    if (u.scheme != "http" && u.scheme != "https") return fail(error, "unsupported scheme");

    const std::string rest = s.substr(schemeEnd + 3);
    const size_t authEnd = rest.find_first_of("/?#");
    std::string authority = (authEnd == std::string::npos) ? rest : rest.substr(0, authEnd);
    std::string tail = (authEnd == std::string::npos) ? std::string() : rest.substr(authEnd);

    // user:pass@host:port - only what follows the last '@' names the destination.
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);
    if (authority.empty()) return fail(error, "empty host");

    std::string portStr;
    if (authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) return fail(error, "unterminated IPv6 literal");
        u.host = ToLowerCopy(authority.substr(1, close - 1));
        if (u.host.empty()) return fail(error, "empty host");
        for (unsigned char c : u.host) {
            if (!std::isxdigit(c) && c != ':' && c != '.') return fail(error, "invalid IPv6 literal");
        }
        const std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after[0] != ':') return fail(error, "invalid authority");
            portStr = after.substr(1);
        }
    } else {
        const size_t colon = authority.rfind(':');
        u.host = ToLowerCopy(colon == std::string::npos ? authority : authority.substr(0, colon));
        if (colon != std::string::npos) portStr = authority.substr(colon + 1);
        if (u.host.empty()) return fail(error, "empty host");
        for (unsigned char c : u.host) {
            if (!IsHostChar(c)) return fail(error, "invalid character in host");
        }
        std::string dotted;
        switch (policy::CanonicalizeNumericHost(u.host, &dotted)) {
            case policy::NumericHost::kIpv4: u.host = dotted; break;
            case policy::NumericHost::kInvalid: return fail(error, "invalid IPv4 address");
            case policy::NumericHost::kName: break;
        }
    }

    u.port = u.defaultPort();
    if (!portStr.empty()) {
        if (portStr.size() > 5) return fail(error, "invalid port");
        unsigned long p = 0;
        for (char c : portStr) {
            if (c < '0' || c > '9') return fail(error, "invalid port");
            p = p * 10 + static_cast<unsigned long>(c - '0');
        }
        if (p == 0 || p > 65535) return fail(error, "invalid port");
        u.port = static_cast<std::uint16_t>(p);
        u.explicitPort = (u.port != u.defaultPort());
    }

    const size_t hash = tail.find('#');
    if (hash != std::string::npos) tail.resize(hash);
    if (tail.empty()) {
        u.target = "/";
    } else if (tail[0] == '?') {
        u.target = "/" + tail;
    } else {
        u.target = tail;
    }
    for (unsigned char c : u.target) {
        if (c <= 0x20 || c == 0x7f) return fail(error, "invalid character in path");
    }

    *out = std::move(u);
    return true;
}

std::string Url::HostHeader() const {
    std::string h = isIpv6Host() ? "[" + host + "]" : host;
    if (explicitPort) h += ":" + std::to_string(port);
    return h;
}

std::string Url::ToString() const {
    return scheme + "://" + HostHeader() + target;
}

} // namespace fetch
} // namespace egress
