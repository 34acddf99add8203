#include "fileshare/util/net_utils.h"
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace fileshare {

std::vector<std::string> get_local_ips() {
    std::vector<std::string> ips;
    ips.push_back("127.0.0.1");

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        return ips;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;

        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        char buf[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf)) == nullptr) continue;
        ips.emplace_back(buf);
    }

    freeifaddrs(ifaddr);
    return ips;
}

std::string normalize_peer_id(const std::string& address) {
    std::string host = address;

    if (!host.empty() && host.front() == '[') {
        auto close = host.find(']');
        host = host.substr(1, close == std::string::npos ? std::string::npos : close - 1);
    } else {
        // "a.b.c.d:port" has exactly one colon; a bare IPv6 address has several
        auto first = host.find(':');
        auto last = host.rfind(':');
        if (first != std::string::npos && first == last) {
            host = host.substr(0, last);
        }
    }

    const std::string mapped_prefix = "::ffff:";
    if (host.rfind(mapped_prefix, 0) == 0 &&
        host.find('.', mapped_prefix.size()) != std::string::npos) {
        host = host.substr(mapped_prefix.size());
    }
    return host;
}

} // namespace fileshare
