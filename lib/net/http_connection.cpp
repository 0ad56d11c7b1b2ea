// SPDX-License-Identifier: MIT

// lib/net/http_connection.cpp
#include "lib/net/http_connection.hpp"

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#include "lib/net/dns_resolver.hpp"

namespace tsdb_pipe {

namespace {

std::string OpenSslErrorString() {
    unsigned long code = ERR_get_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

// Connect with an optional deadline, leaving the socket in blocking mode
std::expected<int, Error> ConnectTo(const ResolvedAddress& ra,
                                    std::chrono::milliseconds timeout) {
    int sock_fd = socket(ra.addr.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (sock_fd < 0) {
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "socket() failed", errno});
    }

    // Disable Nagle: requests are written in one piece and we wait for the reply
    int opt = 1;
    setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));

    int ret = connect(sock_fd, reinterpret_cast<const sockaddr*>(&ra.addr), ra.len);
    if (ret < 0 && errno != EINPROGRESS) {
        auto err = errno;
        ::close(sock_fd);
        return std::unexpected(Error{ErrorCode::ConnectionFailed, "connect() failed", err});
    }

    if (ret < 0) {
        pollfd pfd{sock_fd, POLLOUT, 0};
        int wait_ms = timeout.count() > 0 ? static_cast<int>(timeout.count()) : -1;
        int n;
        do {
            n = poll(&pfd, 1, wait_ms);
        } while (n < 0 && errno == EINTR);
        if (n == 0) {
            ::close(sock_fd);
            return std::unexpected(Error{ErrorCode::Timeout, "connect() timed out", ETIMEDOUT});
        }
        if (n < 0) {
            auto err = errno;
            ::close(sock_fd);
            return std::unexpected(Error{ErrorCode::ConnectionFailed, "poll() failed", err});
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(sock_fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            ::close(sock_fd);
            return std::unexpected(Error{ErrorCode::ConnectionFailed,
                                         "connect() failed", so_error});
        }
    }

    int flags = fcntl(sock_fd, F_GETFL, 0);
    fcntl(sock_fd, F_SETFL, flags & ~O_NONBLOCK);

    if (timeout.count() > 0) {
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
        tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
        setsockopt(sock_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(sock_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }
    return sock_fd;
}

}  // namespace

std::expected<std::shared_ptr<TlsContext>, Error> TlsContext::Create(
    bool insecure_skip_verify) {
    SSL_CTX* ctx = SSL_CTX_new(TLS_client_method());
    if (ctx == nullptr) {
        return std::unexpected(Error{ErrorCode::TlsHandshakeFailed,
            "SSL_CTX_new failed: " + OpenSslErrorString()});
    }
    SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
    if (insecure_skip_verify) {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
    } else {
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
            std::string msg = OpenSslErrorString();
            SSL_CTX_free(ctx);
            return std::unexpected(Error{ErrorCode::TlsHandshakeFailed,
                "failed to load default CA paths: " + msg});
        }
    }
    return std::shared_ptr<TlsContext>(new TlsContext(ctx, !insecure_skip_verify));
}

TlsContext::~TlsContext() {
    SSL_CTX_free(ctx_);
}

std::expected<std::unique_ptr<HttpConnection>, Error> HttpConnection::Dial(
    const Url& url, const TlsContext* tls, std::chrono::milliseconds timeout) {
    auto addrs = ResolveHostname(url.host, url.port);
    if (!addrs) return std::unexpected(addrs.error());

    Error last{ErrorCode::ConnectionFailed, "no addresses for " + url.host};
    for (const auto& ra : *addrs) {
        auto fd = ConnectTo(ra, timeout);
        if (!fd) {
            last = fd.error();
            continue;
        }
        std::unique_ptr<HttpConnection> conn(new HttpConnection(*fd));
        if (url.IsTls()) {
            if (tls == nullptr) {
                return std::unexpected(Error{ErrorCode::TlsHandshakeFailed,
                    "https address without TLS context"});
            }
            if (auto r = conn->StartTls(url, *tls); !r) {
                return std::unexpected(r.error());
            }
        }
        return conn;
    }
    last.message += " (" + url.host + ":" + std::to_string(url.port) + ")";
    return std::unexpected(last);
}

HttpConnection::~HttpConnection() { Close(); }

void HttpConnection::Close() {
    if (ssl_ != nullptr) {
        SSL_shutdown(ssl_);
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    reusable_ = false;
}

std::expected<void, Error> HttpConnection::StartTls(const Url& url, const TlsContext& tls) {
    ssl_ = SSL_new(tls.Get());
    if (ssl_ == nullptr) {
        return std::unexpected(Error{ErrorCode::TlsHandshakeFailed,
            "SSL_new failed: " + OpenSslErrorString()});
    }
    SSL_set_fd(ssl_, fd_);
    // SNI (Server Name Indication)
    SSL_set_tlsext_host_name(ssl_, url.host.c_str());
    if (tls.VerifyPeer()) {
        SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        if (SSL_set1_host(ssl_, url.host.c_str()) != 1) {
            return std::unexpected(Error{ErrorCode::TlsHandshakeFailed,
                "SSL_set1_host failed: " + OpenSslErrorString()});
        }
    }
    if (SSL_connect(ssl_) != 1) {
        return std::unexpected(Error{ErrorCode::TlsHandshakeFailed,
            "TLS handshake with " + url.host + " failed: " + OpenSslErrorString()});
    }
    return {};
}

std::expected<void, Error> HttpConnection::SendAll(std::string_view data) {
    while (!data.empty()) {
        if (ssl_ != nullptr) {
            int n = SSL_write(ssl_, data.data(), static_cast<int>(data.size()));
            if (n <= 0) {
                int err = SSL_get_error(ssl_, n);
                if (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    return std::unexpected(Error{ErrorCode::Timeout, "write timed out", errno});
                }
                return std::unexpected(Error{ErrorCode::ConnectionClosed,
                    "SSL_write failed: " + OpenSslErrorString()});
            }
            data.remove_prefix(static_cast<size_t>(n));
            continue;
        }

        ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return std::unexpected(Error{ErrorCode::Timeout, "write timed out", errno});
            }
            return std::unexpected(Error{ErrorCode::ConnectionClosed, "send() failed", errno});
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
    return {};
}

std::expected<size_t, Error> HttpConnection::Receive(char* buf, size_t len) {
    if (ssl_ != nullptr) {
        int n = SSL_read(ssl_, buf, static_cast<int>(len));
        if (n > 0) return static_cast<size_t>(n);
        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        if (err == SSL_ERROR_SYSCALL) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return std::unexpected(Error{ErrorCode::Timeout, "read timed out", errno});
            }
            if (errno == 0) return 0;
        }
        return std::unexpected(Error{ErrorCode::ConnectionClosed,
            "SSL_read failed: " + OpenSslErrorString()});
    }

    for (;;) {
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return std::unexpected(Error{ErrorCode::Timeout, "read timed out", errno});
        }
        return std::unexpected(Error{ErrorCode::ConnectionClosed, "recv() failed", errno});
    }
}

bool HttpConnection::IsStale() const {
    if (fd_ < 0) return true;
    char c;
    for (;;) {
        ssize_t n = ::recv(fd_, &c, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n >= 0) return true;
        if (errno == EINTR) continue;
        return errno != EAGAIN && errno != EWOULDBLOCK;
    }
}

std::expected<HttpResponse, Error> HttpConnection::RoundTrip(std::string_view request) {
    reusable_ = false;
    request_sent_ = false;
    parser_.Reset();

    if (fd_ < 0) {
        return std::unexpected(Error{ErrorCode::ConnectionClosed, "connection is closed"});
    }
    if (auto r = SendAll(request); !r) {
        Close();
        return std::unexpected(r.error());
    }
    request_sent_ = true;

    std::array<char, kReadChunk> buf;
    for (;;) {
        auto n = Receive(buf.data(), buf.size());
        if (!n) {
            Close();
            return std::unexpected(n.error());
        }
        if (*n == 0) {
            auto done = parser_.Finish();
            Close();
            if (!done) return std::unexpected(done.error());
            return parser_.TakeResponse();
        }
        auto complete = parser_.Feed(std::string_view(buf.data(), *n));
        if (!complete) {
            Close();
            return std::unexpected(complete.error());
        }
        if (*complete) break;
    }

    reusable_ = parser_.ShouldKeepAlive();
    if (!reusable_) Close();
    return parser_.TakeResponse();
}

}  // namespace tsdb_pipe
