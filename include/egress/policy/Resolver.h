#pragma once

#include <functional>
#include <string>
#include <vector>

namespace egress {
namespace policy {

// Maps a hostname to its addresses (textual IPv4/IPv6). Throws on failure.
using Resolver = std::function<std::vector<std::string>(const std::string& hostname)>;

// getaddrinfo()-backed resolver. Returns every distinct address, in the order
// the system returned them; throws std::runtime_error on lookup failure.
std::vector<std::string> SystemResolve(const std::string& hostname);

inline Resolver SystemResolver() { return &SystemResolve; }

} // namespace policy
} // namespace egress
