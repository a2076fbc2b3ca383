#include "egress/policy/Resolver.h"
#include "egress/common/Logger.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace egress {
namespace policy {

std::vector<std::string> SystemResolve(const std::string& hostname) {
    addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    const int gai = ::getaddrinfo(hostname.c_str(), nullptr, &hints, &res);
    if (gai != 0) {
        throw std::runtime_error("resolve " + hostname + ": " + ::gai_strerror(gai));
    }

    std::vector<std::string> out;
    for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        char buf[INET6_ADDRSTRLEN];
        const void* src = nullptr;
        if (ai->ai_family == AF_INET) {
            src = &reinterpret_cast<const sockaddr_in*>(ai->ai_addr)->sin_addr;
        } else if (ai->ai_family == AF_INET6) {
            src = &reinterpret_cast<const sockaddr_in6*>(ai->ai_addr)->sin6_addr;
        } else {
            continue;
        }
        if (!::inet_ntop(ai->ai_family, src, buf, sizeof(buf))) continue;
        std::string ip(buf);
        if (std::find(out.begin(), out.end(), ip) == out.end()) out.push_back(std::move(ip));
    }
    ::freeaddrinfo(res);

    LOG_DEBUG << "SystemResolve " << hostname << " -> " << out.size() << " address(es)";
    return out;
}

} // namespace policy
} // namespace egress
