// SPDX-License-Identifier: MIT

// lib/net/url_encode.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace tsdb_pipe {

namespace url_detail {

// RFC 3986 unreserved set: ASCII letters and digits plus "-._~"
constexpr bool IsUnreserved(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '.' || c == '_' || c == '~';
}

template <typename OutputIt>
OutputIt PercentEscape(OutputIt out, unsigned char c) {
    constexpr std::string_view kHex = "0123456789ABCDEF";
    *out++ = '%';
    *out++ = kHex[c >> 4];
    *out++ = kHex[c & 0x0F];
    return out;
}

}  // namespace url_detail

// Query component encoding: every byte outside the unreserved set becomes %XX
template <typename OutputIt>
OutputIt UrlEncode(OutputIt out, std::string_view value) {
    for (char c : value) {
        if (url_detail::IsUnreserved(c)) {
            *out++ = c;
        } else {
            out = url_detail::PercentEscape(out, static_cast<unsigned char>(c));
        }
    }
    return out;
}

// Like UrlEncode, with '/' left alone so "/rest/sql/<db>" keeps its segments
template <typename OutputIt>
OutputIt PathEncode(OutputIt out, std::string_view path) {
    for (char c : path) {
        if (c == '/' || url_detail::IsUnreserved(c)) {
            *out++ = c;
        } else {
            out = url_detail::PercentEscape(out, static_cast<unsigned char>(c));
        }
    }
    return out;
}

// Standard base64 with '=' padding, for the Authorization: Basic header
template <typename OutputIt>
OutputIt Base64Encode(OutputIt out, std::string_view input) {
    constexpr std::string_view kAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    for (size_t i = 0; i < input.size(); i += 3) {
        const size_t n = input.size() - i < 3 ? input.size() - i : 3;
        uint32_t group = 0;
        for (size_t k = 0; k < 3; ++k) {
            group <<= 8;
            if (k < n) group |= static_cast<uint8_t>(input[i + k]);
        }
        // n bytes carry n + 1 sextets; the rest of the quad is padding
        for (size_t k = 0; k < 4; ++k) {
            *out++ = k <= n ? kAlphabet[(group >> (18 - 6 * k)) & 0x3F] : '=';
        }
    }
    return out;
}

}  // namespace tsdb_pipe
