#include "egress/policy/IpMask.h"

#include <arpa/inet.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

namespace egress {
namespace policy {

static std::string TrimCopy(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

static bool IsV4Mapped(const std::uint8_t* b) {
    for (int i = 0; i < 10; ++i) {
        if (b[i] != 0) return false;
    }
    return b[10] == 0xff && b[11] == 0xff;
}

bool IpAddress::Parse(const std::string& text, IpAddress* out) {
    if (!out || text.empty()) return false;

    in_addr v4;
    std::memset(&v4, 0, sizeof(v4));
    if (::inet_pton(AF_INET, text.c_str(), &v4) == 1) {
        out->family = Family::kV4;
        out->bytes.fill(0);
        std::memcpy(out->bytes.data(), &v4.s_addr, 4);
        return true;
    }

    in6_addr v6;
    std::memset(&v6, 0, sizeof(v6));
    if (::inet_pton(AF_INET6, text.c_str(), &v6) == 1) {
        out->bytes.fill(0);
        if (IsV4Mapped(v6.s6_addr)) {
            out->family = Family::kV4;
            std::memcpy(out->bytes.data(), v6.s6_addr + 12, 4);
        } else {
            out->family = Family::kV6;
            std::memcpy(out->bytes.data(), v6.s6_addr, 16);
        }
        return true;
    }
    return false;
}

// One IPv4 part; false on an empty part or a digit outside its radix.
static bool ParseIpv4Number(const std::string& part, std::uint64_t* out) {
    if (part.empty()) return false;
    std::string digits = part;
    int radix = 10;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
        radix = 16;
    } else if (digits.size() >= 2 && digits[0] == '0') {
        digits = digits.substr(1);
        radix = 8;
    }
    std::uint64_t v = 0;
    for (unsigned char c : digits) {
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (radix == 16 && std::isxdigit(c)) d = std::tolower(c) - 'a' + 10;
        else return false;
        if (d >= radix) return false;
        v = v * static_cast<std::uint64_t>(radix) + static_cast<std::uint64_t>(d);
        if (v > 0xffffffffULL) v = 0x100000000ULL; // saturate, rejected below
    }
    *out = v;
    return true;
}

static bool EndsInNumber(const std::vector<std::string>& parts) {
    const std::string& last = parts.back();
    if (last.empty()) return false;
    if (std::all_of(last.begin(), last.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) return true;
    std::uint64_t ignored = 0;
    return last.size() >= 2 && last[0] == '0' && (last[1] == 'x' || last[1] == 'X') &&
           (last.size() == 2 || ParseIpv4Number(last, &ignored));
}

NumericHost CanonicalizeNumericHost(const std::string& host, std::string* dotted) {
    if (host.empty() || host.find(':') != std::string::npos) return NumericHost::kName;

    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t dot = host.find('.', start);
        parts.push_back(host.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    if (parts.size() > 1 && parts.back().empty()) parts.pop_back();
    if (!EndsInNumber(parts)) return NumericHost::kName;
    if (parts.size() > 4) return NumericHost::kInvalid;

    std::vector<std::uint64_t> numbers;
    for (const auto& p : parts) {
        std::uint64_t n = 0;
        if (p == "0x" || p == "0X") n = 0;
        else if (!ParseIpv4Number(p, &n)) return NumericHost::kInvalid;
        numbers.push_back(n);
    }
    for (size_t i = 0; i + 1 < numbers.size(); ++i) {
        if (numbers[i] > 255) return NumericHost::kInvalid;
    }
    const size_t freeBytes = 5 - numbers.size();
    if (numbers.back() >= (1ULL << (8 * freeBytes))) return NumericHost::kInvalid;

    std::uint64_t value = numbers.back();
    for (size_t i = 0; i + 1 < numbers.size(); ++i) {
        value += numbers[i] << (8 * (3 - i));
    }
    if (dotted) {
        *dotted = std::to_string((value >> 24) & 0xff) + "." + std::to_string((value >> 16) & 0xff) + "." +
                  std::to_string((value >> 8) & 0xff) + "." + std::to_string(value & 0xff);
    }
    return NumericHost::kIpv4;
}

std::string IpAddress::ToString() const {
    char buf[INET6_ADDRSTRLEN];
    const int af = (family == Family::kV4) ? AF_INET : AF_INET6;
    if (!::inet_ntop(af, bytes.data(), buf, sizeof(buf))) return std::string();
    return buf;
}

bool IpMask::Parse(const std::string& cidr, IpMask* out) {
    if (!out) return false;
    std::string s = TrimCopy(cidr);
    if (s.empty()) return false;

    auto slash = s.find('/');
    std::string ipPart = TrimCopy((slash == std::string::npos) ? s : s.substr(0, slash));

    IpAddress ip;
    if (!IpAddress::Parse(ipPart, &ip)) return false;
    const int maxPrefix = static_cast<int>(ip.length() * 8);

    int prefix = maxPrefix;
    if (slash != std::string::npos) {
        const std::string prefixPart = TrimCopy(s.substr(slash + 1));
        if (prefixPart.empty() || prefixPart.size() > 3) return false;
        prefix = 0;
        for (char c : prefixPart) {
            if (c < '0' || c > '9') return false;
            prefix = prefix * 10 + (c - '0');
        }
        // "::ffff:10.0.0.0/104" was unmapped to v4; shift the prefix with it.
        if (ip.family == IpAddress::Family::kV4 && ipPart.find(':') != std::string::npos) {
            if (prefix < 96) return false;
            prefix -= 96;
        }
        if (prefix > maxPrefix) return false;
    }

    // Clear host bits.
    for (int i = 0; i < static_cast<int>(ip.length()); ++i) {
        const int bitsHere = std::max(0, std::min(8, prefix - i * 8));
        const std::uint8_t m = (bitsHere == 0) ? 0 : static_cast<std::uint8_t>(0xFFu << (8 - bitsHere));
        ip.bytes[i] &= m;
    }

    out->network_ = ip;
    out->prefix_ = prefix;
    return true;
}

bool IpMask::Contains(const IpAddress& ip) const {
    if (ip.family != network_.family) return false;
    int remaining = prefix_;
    for (size_t i = 0; i < ip.length() && remaining > 0; ++i, remaining -= 8) {
        const int bitsHere = std::min(8, remaining);
        const std::uint8_t m = static_cast<std::uint8_t>(0xFFu << (8 - bitsHere));
        if ((ip.bytes[i] & m) != network_.bytes[i]) return false;
    }
    return true;
}

bool IpMask::Contains(const std::string& ip) const {
    IpAddress addr;
    if (!IpAddress::Parse(ip, &addr)) return false;
    return Contains(addr);
}

std::string IpMask::ToString() const {
    return network_.ToString() + "/" + std::to_string(prefix_);
}

} // namespace policy
} // namespace egress
