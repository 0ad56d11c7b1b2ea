// SPDX-License-Identifier: MIT

// src/client.cpp
#include "src/client.hpp"

#include <iterator>

#include <fmt/format.h>

#include "lib/net/gzip.hpp"
#include "lib/net/url_encode.hpp"
#include "src/log.hpp"

namespace tsdb_pipe {

namespace {

constexpr std::string_view kWritePath = "influxdb/v1/write";
constexpr std::string_view kSqlPath = "rest/sql";
constexpr size_t kMaxDiagnosticBody = 1024;

}  // namespace

std::expected<ContentEncoding, Error> ParseContentEncoding(std::string_view name) {
    if (name.empty()) return ContentEncoding::None;
    if (name == "gzip") return ContentEncoding::Gzip;
    return std::unexpected(Error{ErrorCode::UnsupportedEncoding,
        fmt::format("unsupported encoding {}", name)});
}

ErrorCode StatusToErrorCode(int status_code) {
    if (status_code == 401 || status_code == 403) return ErrorCode::Unauthorized;
    if (status_code == 404) return ErrorCode::NotFound;
    if (status_code >= 500) return ErrorCode::ServerError;
    return ErrorCode::HttpError;
}

std::expected<std::shared_ptr<Client>, Error> Client::Create(
    HttpConfig config, std::shared_ptr<IHttpTransport> transport) {
    auto url = ParseUrl(config.addr);
    if (!url) return std::unexpected(url.error());

    if (config.user_agent.empty()) {
        config.user_agent = "tsdb_pipe";
    }

    if (!transport) {
        auto pooled = PooledHttpTransport::Create(*url, config.timeout,
                                                  config.insecure_skip_verify);
        if (!pooled) return std::unexpected(pooled.error());
        transport = std::move(*pooled);
    }

    return std::shared_ptr<Client>(
        new Client(std::move(config), std::move(*url), std::move(transport)));
}

HttpRequest Client::NewRequest(std::string path, std::string body) const {
    HttpRequest req;
    req.method = "POST";
    req.path = std::move(path);
    req.body = std::move(body);
    req.headers.emplace_back("Content-Type", "");
    req.headers.emplace_back("User-Agent", config_.user_agent);
    if (!config_.username.empty()) {
        std::string auth = "Basic ";
        Base64Encode(std::back_inserter(auth), config_.username + ":" + config_.password);
        req.headers.emplace_back("Authorization", std::move(auth));
    }
    return req;
}

std::expected<void, Error> Client::Write(const BatchPoints& batch) {
    std::string lines;
    for (const auto& point : batch.Points()) {
        if (!point) continue;
        lines += point->PrecisionString(batch.Precision());
        lines += '\n';
    }

    if (config_.write_encoding == ContentEncoding::Gzip) {
        auto compressed = GzipCompress(lines);
        if (!compressed) return std::unexpected(compressed.error());
        lines = std::move(*compressed);
    }

    HttpRequest req = NewRequest(JoinPath({url_.base_path, kWritePath}), std::move(lines));
    if (config_.write_encoding == ContentEncoding::Gzip) {
        req.headers.emplace_back("Content-Encoding", "gzip");
    }
    req.query.emplace_back("db", batch.Database());
    req.query.emplace_back("precision", std::string(ToString(batch.Precision())));

    auto resp = transport_->RoundTrip(req);
    if (!resp) {
        Log::debug("client") << "write to " << url_.host << " failed: " << resp.error().message;
        return std::unexpected(resp.error());
    }

    if (resp->status_code != 200 && resp->status_code != 204) {
        Log::debug("client") << "write rejected with status " << resp->status_code;
        return std::unexpected(Error{StatusToErrorCode(resp->status_code),
                                     std::move(resp->body), 0, resp->status_code});
    }
    return {};
}

std::expected<QueryResponse, Error> Client::Query(const SqlQuery& query) {
    HttpRequest req = NewRequest(JoinPath({url_.base_path, kSqlPath, query.database}),
                                 query.command);

    auto resp = transport_->RoundTrip(req);
    if (!resp) {
        Log::debug("client") << "query to " << url_.host << " failed: " << resp.error().message;
        return std::unexpected(resp.error());
    }

    const int status = resp->status_code;
    if (status >= 500) {
        std::string msg = resp->body.empty()
            ? fmt::format("received status code {} from downstream server", status)
            : fmt::format("received status code {} from downstream server, "
                          "with response body: {:?}", status, resp->body);
        return std::unexpected(Error{ErrorCode::ServerError, std::move(msg), 0, status});
    }

    // A non-JSON reply did not come from the database itself
    std::string media_type = MediaType(resp->Header("content-type").value_or(""));
    if (media_type != "application/json") {
        std::string_view head = std::string_view(resp->body).substr(0, kMaxDiagnosticBody);
        std::string msg = head.empty()
            ? fmt::format("expected json response, got empty body, with status: {}", status)
            : fmt::format("expected json response, got {:?}, with status: {} "
                          "and response body: {:?}", media_type, status, head);
        return std::unexpected(Error{ErrorCode::UnexpectedContentType, std::move(msg), 0,
                                     status});
    }

    QueryResponse response;
    auto decoded = ParseQueryResponse(resp->body);
    if (decoded) {
        response = std::move(*decoded);
    } else if (decoded.error().kind != JsonErrorKind::EmptyDocument || status == 200) {
        return std::unexpected(Error{ErrorCode::ParseError,
            fmt::format("unable to decode json: received status code {} err: {}", status,
                        decoded.error().message), 0, status});
    }

    if (status != 200 && !response.ApplicationError()) {
        return std::unexpected(Error{StatusToErrorCode(status),
            fmt::format("received status code {} from server", status), 0, status});
    }
    return response;
}

std::expected<PingResult, Error> Client::Ping() {
    auto start = std::chrono::steady_clock::now();
    auto resp = Query(SqlQuery{"select server_version() as version", "", ""});
    if (!resp) return std::unexpected(resp.error());
    if (auto app_err = resp->ApplicationError()) return std::unexpected(*app_err);

    if (resp->data.empty() || resp->data.back().empty()) {
        return std::unexpected(Error{ErrorCode::DecodeError,
                                     "get server version response empty"});
    }
    const auto* version = std::get_if<std::string>(&resp->data.back().front());
    if (version == nullptr) {
        return std::unexpected(Error{ErrorCode::DecodeError,
                                     "server version is not a string"});
    }
    return PingResult{std::chrono::duration_cast<std::chrono::nanoseconds>(
                          std::chrono::steady_clock::now() - start),
                      *version};
}

void Client::Close() {
    transport_->CloseIdleConnections();
}

}  // namespace tsdb_pipe
