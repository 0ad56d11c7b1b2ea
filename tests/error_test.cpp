// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <cerrno>

#include <gtest/gtest.h>

#include "lib/net/error.hpp"

using namespace tsdb_pipe;

TEST(ErrorTest, Construction) {
    Error err{ErrorCode::ConnectionFailed, "connection refused"};
    EXPECT_EQ(err.code, ErrorCode::ConnectionFailed);
    EXPECT_EQ(err.message, "connection refused");
    EXPECT_EQ(err.os_errno, 0);
    EXPECT_EQ(err.status_code, 0);
}

TEST(ErrorTest, WithErrno) {
    Error err{ErrorCode::ConnectionFailed, "connection refused", ECONNREFUSED};
    EXPECT_EQ(err.os_errno, ECONNREFUSED);
}

TEST(ErrorTest, WithStatusCode) {
    Error err{ErrorCode::Unauthorized, "bad credentials", 0, 401};
    EXPECT_EQ(err.status_code, 401);
}

TEST(ErrorTest, CategoryString) {
    // Configuration
    EXPECT_EQ(error_category(ErrorCode::InvalidAddress), "config");
    EXPECT_EQ(error_category(ErrorCode::InvalidPrecision), "config");
    EXPECT_EQ(error_category(ErrorCode::UnsupportedEncoding), "config");
    EXPECT_EQ(error_category(ErrorCode::InvalidPoint), "config");

    // Connection
    EXPECT_EQ(error_category(ErrorCode::ConnectionFailed), "connection");
    EXPECT_EQ(error_category(ErrorCode::ConnectionClosed), "connection");
    EXPECT_EQ(error_category(ErrorCode::DnsResolutionFailed), "connection");
    EXPECT_EQ(error_category(ErrorCode::Timeout), "connection");

    EXPECT_EQ(error_category(ErrorCode::TlsHandshakeFailed), "tls");

    // HTTP
    EXPECT_EQ(error_category(ErrorCode::HttpError), "http");
    EXPECT_EQ(error_category(ErrorCode::ServerError), "http");
    EXPECT_EQ(error_category(ErrorCode::UnexpectedContentType), "http");

    // Decode
    EXPECT_EQ(error_category(ErrorCode::ParseError), "decode");
    EXPECT_EQ(error_category(ErrorCode::DecodeError), "decode");
    EXPECT_EQ(error_category(ErrorCode::CompressionError), "decode");

    EXPECT_EQ(error_category(ErrorCode::ApplicationError), "application");
    EXPECT_EQ(error_category(ErrorCode::TableNotExists), "application");
    EXPECT_EQ(error_category(ErrorCode::SubscriptionFailed), "subscription");
}

TEST(ErrorTest, TableNotExistsSentinel) {
    const Error& a = TableNotExistsError();
    const Error& b = TableNotExistsError();
    EXPECT_EQ(&a, &b);
    EXPECT_TRUE(IsTableNotExists(a));
    EXPECT_EQ(a.message, "table does not exist");
    EXPECT_FALSE(IsTableNotExists(Error{ErrorCode::ApplicationError, "syntax error"}));
}
