// SPDX-License-Identifier: MIT

// src/client.hpp
#pragma once

#include <chrono>
#include <expected>
#include <memory>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "lib/net/error.hpp"
#include "lib/net/http_transport.hpp"
#include "lib/net/url.hpp"
#include "src/batch_points.hpp"
#include "src/query_response.hpp"

namespace tsdb_pipe {

enum class ContentEncoding : uint8_t {
    None,
    Gzip,
};

// Parse "" or "gzip"
std::expected<ContentEncoding, Error> ParseContentEncoding(std::string_view name);

struct HttpConfig {
    // "http://host:port" or "https://host:port", optionally with a base path
    std::string addr;
    std::string username;  // basic auth is sent only when non-empty
    std::string password;
    std::string user_agent = "tsdb_pipe";
    std::chrono::milliseconds timeout{0};  // 0 = no timeout
    bool insecure_skip_verify = false;
    ContentEncoding write_encoding = ContentEncoding::None;
};

// A SQL command and where to run it. Precision is carried for callers; the
// SQL endpoint does not take it.
struct SqlQuery {
    std::string command;
    std::string database;
    std::string precision;
};

struct PingResult {
    std::chrono::nanoseconds duration;
    std::string version;
};

// Client - write and query operations against the database REST endpoints
//
// Immutable after Create(). Safe for concurrent use: every call is one
// blocking round trip on the shared transport. Nothing is retried here.
class Client {
public:
    // Fails fast on an invalid address. When transport is null a
    // PooledHttpTransport is created for the address.
    static std::expected<std::shared_ptr<Client>, Error> Create(
        HttpConfig config, std::shared_ptr<IHttpTransport> transport = nullptr);

    // POST <base>/influxdb/v1/write?db=<database>&precision=<unit>
    // Null points are skipped. 200 and 204 are success; any other status
    // fails with the response body as the message.
    std::expected<void, Error> Write(const BatchPoints& batch);

    // POST <base>/rest/sql[/<database>] with the command as body.
    // The application error in the payload is left for the caller to check
    // through QueryResponse::ApplicationError().
    std::expected<QueryResponse, Error> Query(const SqlQuery& query);

    // Round trip a "select server_version()" query
    std::expected<PingResult, Error> Ping();

    // Release idle connections
    void Close();

    const Url& BaseUrl() const { return url_; }

private:
    Client(HttpConfig config, Url url, std::shared_ptr<IHttpTransport> transport)
        : config_(std::move(config)), url_(std::move(url)), transport_(std::move(transport)) {}

    HttpRequest NewRequest(std::string path, std::string body) const;

    HttpConfig config_;
    Url url_;
    std::shared_ptr<IHttpTransport> transport_;
};

// Error code for an HTTP status on the write path
ErrorCode StatusToErrorCode(int status_code);

}  // namespace tsdb_pipe
