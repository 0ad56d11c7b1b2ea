// SPDX-License-Identifier: MIT

// lib/net/url.hpp
#pragma once

#include <cctype>
#include <charconv>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>

#include "lib/net/error.hpp"

namespace tsdb_pipe {

// Url - the parts of an http(s) base address the transport needs
struct Url {
    std::string scheme;     // "http" or "https"
    std::string host;       // hostname or IPv4 literal, IPv6 without brackets
    uint16_t port = 0;      // explicit port or scheme default
    std::string base_path;  // path prefix without trailing slash, may be empty

    bool IsTls() const { return scheme == "https"; }

    // Value for the Host header (port omitted when it is the scheme default)
    std::string HostHeader() const {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        const bool default_port = (scheme == "http" && port == 80) ||
                                  (scheme == "https" && port == 443);
        if (!default_port) {
            h += ':';
            h += std::to_string(port);
        }
        return h;
    }
};

// Parse "scheme://host[:port][/path]". Only http and https are accepted.
inline std::expected<Url, Error> ParseUrl(std::string_view addr) {
    auto scheme_end = addr.find("://");
    if (scheme_end == std::string_view::npos) {
        return std::unexpected(Error{ErrorCode::InvalidAddress,
            "Unsupported protocol scheme: " + std::string(addr) +
            ", your address must start with http:// or https://"});
    }

    Url url;
    url.scheme = std::string(addr.substr(0, scheme_end));
    for (char& c : url.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (url.scheme != "http" && url.scheme != "https") {
        return std::unexpected(Error{ErrorCode::InvalidAddress,
            "Unsupported protocol scheme: " + url.scheme +
            ", your address must start with http:// or https://"});
    }

    std::string_view rest = addr.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, path_start);
    if (path_start != std::string_view::npos && rest[path_start] == '/') {
        std::string_view path = rest.substr(path_start);
        path = path.substr(0, path.find_first_of("?#"));
        while (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        url.base_path = std::string(path);
    }

    // Credentials in the authority are not supported; use HttpConfig instead
    if (authority.find('@') != std::string_view::npos) {
        return std::unexpected(Error{ErrorCode::InvalidAddress,
            "user info in address is not supported: " + std::string(addr)});
    }

    std::string_view port_str;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return std::unexpected(Error{ErrorCode::InvalidAddress,
                "missing ']' in host: " + std::string(addr)});
        }
        url.host = std::string(authority.substr(1, close - 1));
        std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return std::unexpected(Error{ErrorCode::InvalidAddress,
                    "invalid port in address: " + std::string(addr)});
            }
            port_str = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host = std::string(authority.substr(0, colon));
            port_str = authority.substr(colon + 1);
        } else {
            url.host = std::string(authority);
        }
    }

    if (url.host.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidAddress,
            "missing host in address: " + std::string(addr)});
    }

    if (port_str.empty()) {
        url.port = url.IsTls() ? 443 : 80;
    } else {
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(),
                                         port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() ||
            port == 0 || port > 65535) {
            return std::unexpected(Error{ErrorCode::InvalidAddress,
                "invalid port in address: " + std::string(addr)});
        }
        url.port = static_cast<uint16_t>(port);
    }

    return url;
}

// Join path segments with exactly one '/' between them.
// Empty segments are skipped; the result always starts with '/'.
inline std::string JoinPath(std::initializer_list<std::string_view> segments) {
    std::string out;
    for (std::string_view seg : segments) {
        while (!seg.empty() && seg.front() == '/') seg.remove_prefix(1);
        while (!seg.empty() && seg.back() == '/') seg.remove_suffix(1);
        if (seg.empty()) continue;
        out += '/';
        out += seg;
    }
    if (out.empty()) out = "/";
    return out;
}

}  // namespace tsdb_pipe
