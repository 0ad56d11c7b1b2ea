// SPDX-License-Identifier: MIT

// lib/net/http_transport.cpp
#include "lib/net/http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "lib/net/gzip.hpp"
#include "lib/net/http_request_builder.hpp"

namespace tsdb_pipe {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool HasHeader(const HeaderList& headers, std::string_view name) {
    return std::any_of(headers.begin(), headers.end(),
                       [name](const auto& h) { return EqualsIgnoreCase(h.first, name); });
}

// Inflate a body the transport asked to be gzipped. The body no longer
// matches Content-Encoding or Content-Length, so both are dropped.
std::expected<void, Error> InflateBody(HttpResponse& response) {
    auto encoding = response.Header("content-encoding");
    if (!encoding || !EqualsIgnoreCase(*encoding, "gzip")) return {};

    auto body = GzipDecompress(response.body);
    if (!body) return std::unexpected(body.error());
    response.body = std::move(*body);
    std::erase_if(response.headers, [](const auto& h) {
        return h.first == "content-encoding" || h.first == "content-length";
    });
    return {};
}

}  // namespace

std::expected<std::shared_ptr<PooledHttpTransport>, Error> PooledHttpTransport::Create(
    const Url& base, std::chrono::milliseconds timeout, bool insecure_skip_verify) {
    std::shared_ptr<TlsContext> tls;
    if (base.IsTls()) {
        auto ctx = TlsContext::Create(insecure_skip_verify);
        if (!ctx) return std::unexpected(ctx.error());
        tls = std::move(*ctx);
    }
    return std::shared_ptr<PooledHttpTransport>(
        new PooledHttpTransport(base, timeout, std::move(tls)));
}

PooledHttpTransport::~PooledHttpTransport() {
    CloseIdleConnections();
}

std::string PooledHttpTransport::Encode(const HttpRequest& request) const {
    std::string out;
    out.reserve(256 + request.body.size());
    HttpRequestBuilder builder(std::back_inserter(out));
    builder.RequestLine(request.method, request.path);
    for (const auto& [key, value] : request.query) {
        builder.Query(key, value);
    }
    builder.Header("Host", base_.HostHeader());
    for (const auto& [name, value] : request.headers) {
        builder.Header(name, value);
    }
    if (!HasHeader(request.headers, "Accept-Encoding")) {
        builder.Header("Accept-Encoding", "gzip");
    }
    builder.Header("Connection", "keep-alive");
    builder.Body(request.body);
    return out;
}

std::unique_ptr<HttpConnection> PooledHttpTransport::TakeIdle() {
    for (;;) {
        std::unique_ptr<HttpConnection> conn;
        {
            std::lock_guard lock(mutex_);
            if (idle_.empty()) return nullptr;
            conn = std::move(idle_.back());
            idle_.pop_back();
        }
        if (!conn->IsStale()) return conn;
    }
}

void PooledHttpTransport::PutIdle(std::unique_ptr<HttpConnection> conn) {
    std::lock_guard lock(mutex_);
    if (idle_.size() < kMaxIdle) {
        idle_.push_back(std::move(conn));
    }
}

std::expected<HttpResponse, Error> PooledHttpTransport::RoundTrip(const HttpRequest& request) {
    auto response = Exchange(Encode(request));
    if (!response) return response;

    // A caller that set Accept-Encoding itself gets the body as sent
    if (!HasHeader(request.headers, "Accept-Encoding")) {
        if (auto r = InflateBody(*response); !r) return std::unexpected(r.error());
    }
    return response;
}

std::expected<HttpResponse, Error> PooledHttpTransport::Exchange(const std::string& wire) {
    if (auto conn = TakeIdle()) {
        auto response = conn->RoundTrip(wire);
        if (response) {
            if (conn->IsReusable()) PutIdle(std::move(conn));
            return response;
        }
        // Once the request went out the server may have acted on it
        if (conn->RequestSent() || response.error().code == ErrorCode::Timeout) {
            return std::unexpected(response.error());
        }
    }

    auto conn = HttpConnection::Dial(base_, tls_.get(), timeout_);
    if (!conn) return std::unexpected(conn.error());

    auto response = (*conn)->RoundTrip(wire);
    if (response && (*conn)->IsReusable()) {
        PutIdle(std::move(*conn));
    }
    return response;
}

void PooledHttpTransport::CloseIdleConnections() {
    std::vector<std::unique_ptr<HttpConnection>> closing;
    {
        std::lock_guard lock(mutex_);
        closing.swap(idle_);
    }
}

}  // namespace tsdb_pipe
