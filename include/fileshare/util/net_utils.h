#ifndef FILESHARE_UTIL_NET_UTILS_H
#define FILESHARE_UTIL_NET_UTILS_H

#include <string>
#include <vector>

namespace fileshare {

// 127.0.0.1 followed by the IPv4 address of every up, non-loopback interface
std::vector<std::string> get_local_ips();

// Peer identity used by the admission gate: host part only.
// "10.0.0.5:51234" -> "10.0.0.5", "[::1]:8080" -> "::1",
// "[::ffff:127.0.0.1]:80" -> "127.0.0.1"
std::string normalize_peer_id(const std::string& address);

} // namespace fileshare

#endif // FILESHARE_UTIL_NET_UTILS_H
