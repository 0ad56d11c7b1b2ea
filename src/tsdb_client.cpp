// SPDX-License-Identifier: MIT

// src/tsdb_client.cpp
#include "src/tsdb_client.hpp"

#include <charconv>
#include <limits>

#include <fmt/format.h>

#include "src/batch_points.hpp"
#include "src/log.hpp"
#include "src/subscription_bridge.hpp"

namespace tsdb_pipe {

namespace {

std::expected<void, Error> RunBridge(const ConsumerFactory& factory, const DbOptions& options,
                                     std::stop_token stop, std::string_view topic,
                                     const std::shared_ptr<Channel<MessagePtr>>& messages) {
    if (!factory) {
        return std::unexpected(Error{ErrorCode::SubscriptionFailed,
                                     "no topic consumer factory configured"});
    }
    auto config = ConsumerConfig::ForTopic(options.database_addr, options.database_user,
                                           options.database_pass, topic);
    if (!config) return std::unexpected(config.error());

    SubscriptionBridge bridge(factory, std::move(*config));
    return bridge.Run(std::move(stop), topic, messages);
}

}  // namespace

std::expected<std::unique_ptr<TsdbClient>, Error> TsdbClient::Create(
    DbOptions options, std::shared_ptr<IHttpTransport> transport,
    ConsumerFactory consumer_factory) {
    auto precision = ParsePrecision(options.precision_unit);
    if (!precision) return std::unexpected(precision.error());

    auto encoding = ParseContentEncoding(options.write_encoding);
    if (!encoding) return std::unexpected(encoding.error());

    HttpConfig config;
    config.addr = options.database_addr;
    config.username = options.database_user;
    config.password = options.database_pass;
    config.timeout = options.timeout;
    config.insecure_skip_verify = options.insecure_skip_verify;
    config.write_encoding = *encoding;

    auto client = Client::Create(std::move(config), std::move(transport));
    if (!client) return std::unexpected(client.error());

    return std::unique_ptr<TsdbClient>(new TsdbClient(
        std::move(options), *precision, std::move(*client), std::move(consumer_factory)));
}

std::expected<std::vector<Row>, Error> TsdbClient::QueryData(std::string_view sql,
                                                             bool convert_number) {
    auto resp = client_->Query(SqlQuery{std::string(sql), options_.database_name,
                                        options_.precision_unit});
    if (!resp) return std::unexpected(resp.error());

    if (auto app_err = resp->ApplicationError()) {
        if (IsTableNotExists(*app_err)) return std::vector<Row>{};
        return std::unexpected(std::move(*app_err));
    }

    return DecodeRows(*resp, DecodeOptions{convert_number, options_.default_number_value});
}

std::expected<void, Error> TsdbClient::WriteData(int64_t ts, std::string name, Tags tags,
                                                 Fields fields) {
    auto batch = BatchPoints::Create(BatchPointsConfig{
        std::string(ToString(precision_)), options_.database_name, "", ""});
    if (!batch) return std::unexpected(batch.error());

    std::optional<Timestamp> time;
    if (ts > 0) {
        const int64_t mult = PrecisionMultiplier(precision_);
        if (ts > std::numeric_limits<int64_t>::max() / mult) {
            return std::unexpected(Error{ErrorCode::InvalidPoint,
                fmt::format("timestamp {}{} is out of range", ts, ToString(precision_))});
        }
        time = Timestamp(std::chrono::nanoseconds(ts * mult));
    }

    auto point = Point::Create(std::move(name), std::move(tags), std::move(fields), time);
    if (!point) return std::unexpected(point.error());
    batch->AddPoint(std::make_unique<Point>(std::move(*point)));

    return client_->Write(*batch);
}

std::expected<ColumnsResult, Error> TsdbClient::QueryColumns(std::string_view sql,
                                                             std::string_view database,
                                                             std::string_view precision) {
    auto resp = client_->Query(SqlQuery{std::string(sql), std::string(database),
                                        std::string(precision)});
    if (!resp) return std::unexpected(resp.error());
    if (auto app_err = resp->ApplicationError()) return std::unexpected(std::move(*app_err));

    auto columns = ColumnNames(*resp);
    if (!columns) return std::unexpected(columns.error());
    return ColumnsResult{std::move(*columns), std::move(resp->data)};
}

std::expected<int64_t, Error> TsdbClient::QueryCount(std::string_view field,
                                                     std::string_view table,
                                                     std::string_view filter) {
    std::string sql = fmt::format("select count(`{}`) as `count` from `{}` ", field, table);
    if (!filter.empty()) {
        if (filter.starts_with("where")) {
            sql += filter;
        } else {
            sql += fmt::format("where {}", filter);
        }
    }
    sql += ';';

    auto rows = QueryData(sql, false);
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) return 0;

    auto it = rows->front().find("count");
    if (it == rows->front().end()) {
        return std::unexpected(Error{ErrorCode::DecodeError, "not result field: count"});
    }
    const auto* num = std::get_if<Number>(&it->second);
    int64_t count = 0;
    if (num == nullptr) {
        return std::unexpected(Error{ErrorCode::DecodeError,
            fmt::format("count is not a number: {}", FormatValue(it->second))});
    }
    const char* end = num->text.data() + num->text.size();
    auto [ptr, ec] = std::from_chars(num->text.data(), end, count);
    if (ec != std::errc{} || ptr != end) {
        return std::unexpected(Error{ErrorCode::DecodeError,
            fmt::format("count is not an integer: {}", num->text)});
    }
    return count;
}

std::expected<bool, Error> TsdbClient::TableExists(std::string_view table, bool super) {
    if (table.empty()) return false;
    auto rows = QueryData(fmt::format("show {} like '{}';", super ? "stables" : "tables", table),
                          false);
    if (!rows) return std::unexpected(rows.error());
    return !rows->empty();
}

std::expected<void, Error> TsdbClient::CreateTopic(std::string_view topic,
                                                   std::string_view content, TopicMode mode) {
    if (topic.empty() || content.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     "miss args: `topic` or `content`"});
    }

    std::string sql;
    switch (mode) {
        case TopicMode::Database:
            sql = fmt::format("create topic if not exists {} as database {}", topic, content);
            break;
        case TopicMode::SuperTable:
            sql = fmt::format("create topic if not exists {} as stable {}", topic, content);
            break;
        case TopicMode::Sql:
            sql = fmt::format("create topic if not exists {} as {}", topic, content);
            break;
        default:
            return std::unexpected(Error{ErrorCode::InvalidArgument,
                fmt::format("not support mode: {}", static_cast<int>(mode))});
    }

    auto rows = QueryData(sql, options_.convert_number);
    if (!rows) return std::unexpected(rows.error());
    return {};
}

std::expected<void, Error> TsdbClient::DropTopic(std::string_view topic) {
    if (topic.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     "invalid args: `topic` is empty"});
    }
    auto rows = QueryData(fmt::format("drop topic if exists {}", topic), options_.convert_number);
    if (!rows) return std::unexpected(rows.error());
    return {};
}

std::expected<void, Error> TsdbClient::Subscribe(
    std::stop_token stop, std::string_view topic,
    const std::shared_ptr<Channel<MessagePtr>>& messages) {
    return RunBridge(consumer_factory_, options_, std::move(stop), topic, messages);
}

std::jthread TsdbClient::StartSubscription(std::string topic,
                                           std::shared_ptr<Channel<MessagePtr>> messages,
                                           std::shared_ptr<ErrorChannel> errors) {
    return std::jthread([factory = consumer_factory_, options = options_,
                         topic = std::move(topic), messages = std::move(messages),
                         errors = std::move(errors)](std::stop_token stop) {
        auto result = RunBridge(factory, options, std::move(stop), topic, messages);

        std::optional<Error> outcome;
        if (!result) outcome = std::move(result.error());
        if (!errors) return;
        if (errors->TrySend(std::move(outcome)) != SendStatus::Sent) {
            Log::warn("subscribe") << "error channel unavailable, dropping subscription result";
        }
    });
}

void TsdbClient::Close() {
    client_->Close();
}

}  // namespace tsdb_pipe
