// SPDX-License-Identifier: MIT

// tests/mock_http_transport.hpp
#pragma once

#include <gmock/gmock.h>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

#include "lib/net/http_transport.hpp"

namespace tsdb_pipe::test {

class MockHttpTransport : public IHttpTransport {
public:
    MOCK_METHOD((std::expected<HttpResponse, Error>), RoundTrip, (const HttpRequest&),
                (override));
    MOCK_METHOD(void, CloseIdleConnections, (), (override));
};

inline HttpResponse JsonResponse(int status, std::string body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.headers.emplace_back("content-type", "application/json");
    resp.body = std::move(body);
    return resp;
}

inline HttpResponse TextResponse(int status, std::string content_type, std::string body) {
    HttpResponse resp;
    resp.status_code = status;
    if (!content_type.empty()) {
        resp.headers.emplace_back("content-type", std::move(content_type));
    }
    resp.body = std::move(body);
    return resp;
}

// Value of a request header, empty when absent
inline std::string RequestHeader(const HttpRequest& req, std::string_view name) {
    for (const auto& [key, value] : req.headers) {
        if (key == name) return value;
    }
    return {};
}

inline bool HasRequestHeader(const HttpRequest& req, std::string_view name) {
    for (const auto& [key, value] : req.headers) {
        if (key == name) return true;
    }
    return false;
}

}  // namespace tsdb_pipe::test
