// SPDX-License-Identifier: MIT

// lib/net/dns_resolver.hpp
#pragma once

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cstring>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "lib/net/error.hpp"

namespace tsdb_pipe {

struct ResolvedAddress {
    sockaddr_storage addr{};
    socklen_t len = 0;
};

// Resolve hostname to socket addresses using getaddrinfo (blocking).
// Returns every address in resolver order so the caller can fall back.
inline std::expected<std::vector<ResolvedAddress>, Error> ResolveHostname(
    std::string_view hostname, uint16_t port) {
    std::string host_str(hostname);
    std::string port_str = std::to_string(port);

    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo* result = nullptr;
    int ret = getaddrinfo(host_str.c_str(), port_str.c_str(), &hints, &result);
    if (ret != 0 || result == nullptr) {
        return std::unexpected(Error{ErrorCode::DnsResolutionFailed,
            "Failed to resolve hostname " + host_str + ": " + gai_strerror(ret)});
    }

    std::vector<ResolvedAddress> out;
    for (auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        ResolvedAddress r;
        std::memcpy(&r.addr, ai->ai_addr, ai->ai_addrlen);
        r.len = static_cast<socklen_t>(ai->ai_addrlen);
        out.push_back(r);
    }

    freeaddrinfo(result);
    return out;
}

}  // namespace tsdb_pipe
