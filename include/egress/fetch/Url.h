#pragma once

#include <cstdint>
#include <string>

namespace egress {
namespace fetch {

// http(s) URL split into the parts the gateway needs. Hosts are lowercased,
// bracketed IPv6 literals are unbracketed, numeric IPv4 forms ("127.1",
// "0x7f000001") become dotted quads, userinfo and fragment are dropped.
struct Url {
    std::string scheme;  // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    bool explicitPort{false};
    std::string target{"/"}; // path + "?" + query

    static bool Parse(const std::string& text, Url* out, std::string* error = nullptr);

    bool isIpv6Host() const { return host.find(':') != std::string::npos; }
    std::uint16_t defaultPort() const { return scheme == "https" ? 443 : 80; }

    // Value for the Host header ("host" or "host:port", IPv6 re-bracketed).
    std::string HostHeader() const;
    std::string ToString() const;
};

} // namespace fetch
} // namespace egress
