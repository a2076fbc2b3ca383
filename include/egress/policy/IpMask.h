#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace egress {
namespace policy {

// A parsed IP address. IPv4 is kept in its own family; IPv4-mapped IPv6
// addresses (::ffff:a.b.c.d) are unmapped to IPv4 so that v4 masks apply to them.
struct IpAddress {
    enum class Family { kV4, kV6 };

    Family family{Family::kV4};
    std::array<std::uint8_t, 16> bytes{}; // v4 uses the first 4 bytes

    static bool Parse(const std::string& text, IpAddress* out);

    std::size_t length() const { return family == Family::kV4 ? 4 : 16; }
    std::string ToString() const;
};

// URL host rules for IPv4: a host whose last label is a number ("127.1",
// "2130706433", "0x7f000001", "0177.0.0.1") names an IPv4 address, each part
// decimal, octal (leading 0) or hex (0x). kIpv4 fills `dotted` with the
// canonical dotted quad; kInvalid is a numeric host that is not a valid address.
enum class NumericHost { kName, kIpv4, kInvalid };
NumericHost CanonicalizeNumericHost(const std::string& host, std::string* dotted);

// CIDR network ("10.0.0.0/8", "fc00::/7"). A bare address is a host mask.
class IpMask {
public:
    static bool Parse(const std::string& cidr, IpMask* out);

    bool Contains(const IpAddress& ip) const;
    bool Contains(const std::string& ip) const;

    IpAddress::Family family() const { return network_.family; }
    int prefix() const { return prefix_; }
    std::string ToString() const;

private:
    IpAddress network_;
    int prefix_{0};
};

} // namespace policy
} // namespace egress
