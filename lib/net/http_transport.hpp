// SPDX-License-Identifier: MIT

// lib/net/http_transport.hpp
#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <vector>

#include "lib/net/error.hpp"
#include "lib/net/http_connection.hpp"
#include "lib/net/http_message.hpp"
#include "lib/net/url.hpp"

namespace tsdb_pipe {

// IHttpTransport - sends one request and returns one response
//
// Implementations must be safe for concurrent use by multiple callers.
// Request paths are absolute; the transport owns the scheme, host and port.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual std::expected<HttpResponse, Error> RoundTrip(const HttpRequest& request) = 0;

    // Release connections kept open for reuse
    virtual void CloseIdleConnections() = 0;
};

// PooledHttpTransport - HTTP/1.1 transport with a keep-alive connection pool
//
// Connections are checked out for the duration of one round trip and returned
// to the idle pool when the server allows keep-alive. Idle connections the
// server already closed are dropped before reuse. A request is re-sent on a
// fresh connection only when writing it to a reused one failed; a request
// that was written is never sent twice. Responses are requested gzipped and
// inflated unless the request sets its own Accept-Encoding.
class PooledHttpTransport : public IHttpTransport {
public:
    static std::expected<std::shared_ptr<PooledHttpTransport>, Error> Create(
        const Url& base, std::chrono::milliseconds timeout, bool insecure_skip_verify);

    ~PooledHttpTransport() override;

    std::expected<HttpResponse, Error> RoundTrip(const HttpRequest& request) override;
    void CloseIdleConnections() override;

private:
    PooledHttpTransport(Url base, std::chrono::milliseconds timeout,
                        std::shared_ptr<TlsContext> tls)
        : base_(std::move(base)), timeout_(timeout), tls_(std::move(tls)) {}

    std::string Encode(const HttpRequest& request) const;
    // Send an encoded request on an idle or fresh connection
    std::expected<HttpResponse, Error> Exchange(const std::string& wire);
    std::unique_ptr<HttpConnection> TakeIdle();
    void PutIdle(std::unique_ptr<HttpConnection> conn);

    Url base_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<TlsContext> tls_;

    std::mutex mutex_;
    std::vector<std::unique_ptr<HttpConnection>> idle_;

    static constexpr size_t kMaxIdle = 8;
};

}  // namespace tsdb_pipe
