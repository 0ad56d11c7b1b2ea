// SPDX-License-Identifier: MIT

// lib/net/http_message.hpp
#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tsdb_pipe {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// One HTTP request as the client describes it. The transport adds Host,
// Content-Length and Connection; everything else is carried verbatim.
struct HttpRequest {
    std::string method = "POST";
    std::string path;     // absolute path, base path already joined in
    HeaderList query;     // query parameters in send order, unencoded
    HeaderList headers;   // extra headers in send order
    std::string body;
};

// A fully received HTTP response. Header names are stored lowercased.
struct HttpResponse {
    int status_code = 0;
    HeaderList headers;
    std::string body;

    std::optional<std::string_view> Header(std::string_view name) const {
        for (const auto& [key, value] : headers) {
            if (key.size() != name.size()) continue;
            bool equal = std::equal(key.begin(), key.end(), name.begin(),
                [](char a, char b) {
                    return a == std::tolower(static_cast<unsigned char>(b));
                });
            if (equal) return std::string_view(value);
        }
        return std::nullopt;
    }
};

// Media type of a Content-Type value: parameters dropped, lowercased, trimmed.
// "Application/JSON; charset=utf-8" -> "application/json"
inline std::string MediaType(std::string_view content_type) {
    content_type = content_type.substr(0, content_type.find(';'));
    while (!content_type.empty() &&
           std::isspace(static_cast<unsigned char>(content_type.front()))) {
        content_type.remove_prefix(1);
    }
    while (!content_type.empty() &&
           std::isspace(static_cast<unsigned char>(content_type.back()))) {
        content_type.remove_suffix(1);
    }
    std::string out(content_type);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

}  // namespace tsdb_pipe
