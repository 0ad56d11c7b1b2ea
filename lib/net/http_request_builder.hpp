// SPDX-License-Identifier: MIT

// lib/net/http_request_builder.hpp
#pragma once

#include <algorithm>
#include <cstddef>
#include <string_view>

#include <fmt/format.h>

#include "lib/net/url_encode.hpp"

namespace tsdb_pipe {

// HttpRequestBuilder - writes one HTTP/1.1 request to an output iterator
//
// Calls follow wire order: RequestLine(), any Query() parameters, Header()
// lines, then Body(), which writes Content-Length and closes the message.
// The first Header() or Body() terminates the request line.
//
//   std::string out;
//   HttpRequestBuilder builder(std::back_inserter(out));
//   builder.RequestLine("POST", "/influxdb/v1/write").Query("db", "iot");
//   builder.Header("Host", "127.0.0.1:6041").Header("Content-Type", "");
//   builder.Body(lines);
template <typename OutputIt>
class HttpRequestBuilder {
public:
    explicit HttpRequestBuilder(OutputIt out) : out_(out) {}

    // The path is percent-encoded segment by segment
    HttpRequestBuilder& RequestLine(std::string_view method, std::string_view path) {
        out_ = std::copy(method.begin(), method.end(), out_);
        *out_++ = ' ';
        out_ = PathEncode(out_, path);
        request_line_open_ = true;
        return *this;
    }

    HttpRequestBuilder& Query(std::string_view key, std::string_view value) {
        *out_++ = query_count_++ == 0 ? '?' : '&';
        out_ = UrlEncode(out_, key);
        *out_++ = '=';
        out_ = UrlEncode(out_, value);
        return *this;
    }

    // An empty value is sent as "Name: "
    HttpRequestBuilder& Header(std::string_view name, std::string_view value) {
        CloseRequestLine();
        out_ = fmt::format_to(out_, "{}: {}\r\n", name, value);
        return *this;
    }

    void Body(std::string_view body) {
        CloseRequestLine();
        out_ = fmt::format_to(out_, "Content-Length: {}\r\n\r\n", body.size());
        out_ = std::copy(body.begin(), body.end(), out_);
    }

private:
    void CloseRequestLine() {
        if (!request_line_open_) return;
        out_ = fmt::format_to(out_, " HTTP/1.1\r\n");
        request_line_open_ = false;
    }

    OutputIt out_;
    size_t query_count_ = 0;
    bool request_line_open_ = false;
};

}  // namespace tsdb_pipe
