// SPDX-License-Identifier: MIT

// lib/net/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace tsdb_pipe {

/// Error codes for all client, transport and subscription operations.
enum class ErrorCode {
    // Configuration
    InvalidAddress,        ///< Address does not parse or uses a scheme other than http/https
    InvalidPrecision,      ///< Precision unit is not one of ns, us, ms, s
    UnsupportedEncoding,   ///< Write content encoding is not supported
    InvalidArgument,       ///< Caller passed an empty or null required argument
    InvalidPoint,          ///< Point name, tags or fields are not representable

    // Connection
    ConnectionFailed,      ///< TCP connection failed (ECONNREFUSED, timeout, etc.)
    ConnectionClosed,      ///< Remote peer closed the connection
    DnsResolutionFailed,   ///< Hostname could not be resolved
    Timeout,               ///< Socket read or write timed out

    // TLS
    TlsHandshakeFailed,    ///< TLS handshake did not complete

    // HTTP
    HttpError,             ///< HTTP-level error (malformed response, unexpected status)
    Unauthorized,          ///< HTTP 401/403
    NotFound,              ///< HTTP 404
    ServerError,           ///< HTTP 5xx
    UnexpectedContentType, ///< Response is not JSON, likely not from the database itself

    // Decode
    ParseError,            ///< JSON, HTTP or line protocol could not be parsed
    DecodeError,           ///< Query response shape is malformed (column metadata)
    BufferOverflow,        ///< Internal buffer exceeded size limit
    CompressionError,      ///< Gzip compression failed

    // Application
    ApplicationError,      ///< Non-zero code or description in a query response
    TableNotExists,        ///< Referenced table or stream does not exist

    // Subscription
    SubscriptionFailed,    ///< Consumer could not be created, subscribed or polled
};

/// Error payload returned through std::expected.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int os_errno = 0;              ///< OS errno if applicable, 0 otherwise
    int status_code = 0;           ///< HTTP status when the error came from a response
};

/// Return a short category string for an error code (e.g. "connection", "http").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidAddress:
        case ErrorCode::InvalidPrecision:
        case ErrorCode::UnsupportedEncoding:
        case ErrorCode::InvalidArgument:
        case ErrorCode::InvalidPoint:
            return "config";
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::DnsResolutionFailed:
        case ErrorCode::Timeout:
            return "connection";
        case ErrorCode::TlsHandshakeFailed:
            return "tls";
        case ErrorCode::HttpError:
        case ErrorCode::Unauthorized:
        case ErrorCode::NotFound:
        case ErrorCode::ServerError:
        case ErrorCode::UnexpectedContentType:
            return "http";
        case ErrorCode::ParseError:
        case ErrorCode::DecodeError:
        case ErrorCode::BufferOverflow:
        case ErrorCode::CompressionError:
            return "decode";
        case ErrorCode::ApplicationError:
        case ErrorCode::TableNotExists:
            return "application";
        case ErrorCode::SubscriptionFailed:
            return "subscription";
    }
    return "unknown";
}

/// The single reusable "table does not exist" error value.
inline const Error& TableNotExistsError() {
    static const Error kError{ErrorCode::TableNotExists, "table does not exist"};
    return kError;
}

/// True when the error is the table-not-exists sentinel.
constexpr bool IsTableNotExists(const Error& e) {
    return e.code == ErrorCode::TableNotExists;
}

}  // namespace tsdb_pipe
