// SPDX-License-Identifier: MIT

// lib/net/http_connection.hpp
#pragma once

#include <openssl/ssl.h>

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>

#include "lib/net/error.hpp"
#include "lib/net/http_message.hpp"
#include "lib/net/http_response_parser.hpp"
#include "lib/net/url.hpp"

namespace tsdb_pipe {

// TlsContext - owns an SSL_CTX shared by every connection of one transport
class TlsContext {
public:
    static std::expected<std::shared_ptr<TlsContext>, Error> Create(
        bool insecure_skip_verify);

    ~TlsContext();

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

    SSL_CTX* Get() const { return ctx_; }
    bool VerifyPeer() const { return verify_peer_; }

private:
    TlsContext(SSL_CTX* ctx, bool verify_peer) : ctx_(ctx), verify_peer_(verify_peer) {}

    SSL_CTX* ctx_;
    bool verify_peer_;
};

// HttpConnection - one blocking HTTP/1.1 connection, optionally over TLS
//
// A connection carries one request at a time. After a successful round trip
// IsReusable() tells whether the peer agreed to keep the connection open.
//
// Thread safety: not thread-safe. The transport hands a connection to one
// caller at a time.
class HttpConnection {
public:
    // Resolve, connect and (for https) complete the TLS handshake.
    // A zero timeout means no timeout.
    static std::expected<std::unique_ptr<HttpConnection>, Error> Dial(
        const Url& url, const TlsContext* tls, std::chrono::milliseconds timeout);

    ~HttpConnection();

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;
    HttpConnection(HttpConnection&&) = delete;
    HttpConnection& operator=(HttpConnection&&) = delete;

    // Send an encoded request and read one complete response
    std::expected<HttpResponse, Error> RoundTrip(std::string_view request);

    // True when the last RoundTrip wrote the whole request to the socket
    bool RequestSent() const { return request_sent_; }

    // True when an idle connection was closed by the peer or has unread
    // bytes; either way it cannot carry another request.
    bool IsStale() const;

    bool IsReusable() const { return reusable_; }

private:
    explicit HttpConnection(int fd) : fd_(fd) {}

    std::expected<void, Error> StartTls(const Url& url, const TlsContext& tls);
    std::expected<void, Error> SendAll(std::string_view data);
    // Returns 0 on orderly EOF
    std::expected<size_t, Error> Receive(char* buf, size_t len);
    void Close();

    int fd_ = -1;
    SSL* ssl_ = nullptr;
    HttpResponseParser parser_;
    bool reusable_ = false;
    bool request_sent_ = false;

    static constexpr size_t kReadChunk = 16 * 1024;
};

}  // namespace tsdb_pipe
