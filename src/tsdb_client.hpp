// SPDX-License-Identifier: MIT

// src/tsdb_client.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "lib/net/error.hpp"
#include "lib/net/http_transport.hpp"
#include "src/channel.hpp"
#include "src/client.hpp"
#include "src/consumer.hpp"
#include "src/options.hpp"
#include "src/point.hpp"
#include "src/result_decoder.hpp"

namespace tsdb_pipe {

enum class TopicMode : uint8_t {
    Database = 1,  // create topic ... as database <content>
    SuperTable,    // create topic ... as stable <content>
    Sql,           // create topic ... as <content>
};

// Raw column names and rows of a query
struct ColumnsResult {
    std::vector<std::string> columns;
    std::vector<std::vector<Value>> rows;
};

using ErrorChannel = Channel<std::optional<Error>>;

// TsdbClient - long-lived client for one database, owned by the caller
//
// Wraps a Client with the configured database, precision and numeric
// conversion, plus topic management and subscriptions. Construct it once at
// startup and pass it where it is needed. Thread-safe.
class TsdbClient {
public:
    // Fails on an invalid address, precision or write encoding. The consumer
    // factory is only needed for Subscribe() and StartSubscription().
    static std::expected<std::unique_ptr<TsdbClient>, Error> Create(
        DbOptions options, std::shared_ptr<IHttpTransport> transport = nullptr,
        ConsumerFactory consumer_factory = nullptr);

    const std::shared_ptr<Client>& HttpClient() const { return client_; }
    const DbOptions& Options() const { return options_; }

    // Query the configured database and project rows by column name.
    // A missing table yields an empty result, not an error.
    std::expected<std::vector<Row>, Error> QueryData(std::string_view sql, bool convert_number);

    // Write one point. ts > 0 is read in the configured precision; otherwise
    // the server assigns the time. A ts that does not fit in nanoseconds
    // fails with InvalidPoint.
    std::expected<void, Error> WriteData(int64_t ts, std::string name, Tags tags,
                                         Fields fields);

    // Write one point stamped with DbOptions::timestamp
    std::expected<void, Error> WriteData(std::string name, Tags tags, Fields fields) {
        return WriteData(options_.timestamp, std::move(name), std::move(tags), std::move(fields));
    }

    // Column names and raw rows of a query against the given database
    std::expected<ColumnsResult, Error> QueryColumns(std::string_view sql,
                                                     std::string_view database,
                                                     std::string_view precision);

    // select count(`field`) as `count` from `table` [where filter];
    // 0 when no row comes back.
    std::expected<int64_t, Error> QueryCount(std::string_view field, std::string_view table,
                                             std::string_view filter);

    // show [s]tables like '<table>';
    std::expected<bool, Error> TableExists(std::string_view table, bool super);

    std::expected<void, Error> CreateTopic(std::string_view topic, std::string_view content,
                                           TopicMode mode);
    std::expected<void, Error> DropTopic(std::string_view topic);

    // Run the subscription bridge on the calling thread until stop is requested
    // or the consumer reports an error.
    std::expected<void, Error> Subscribe(std::stop_token stop, std::string_view topic,
                                         const std::shared_ptr<Channel<MessagePtr>>& messages);

    // Run the subscription bridge on its own thread. The outcome is pushed to
    // errors once (std::nullopt for a clean stop); give it room for one item.
    // Destroying the returned thread requests stop and joins.
    std::jthread StartSubscription(std::string topic,
                                   std::shared_ptr<Channel<MessagePtr>> messages,
                                   std::shared_ptr<ErrorChannel> errors);

    // Release idle connections
    void Close();

private:
    TsdbClient(DbOptions options, TimePrecision precision, std::shared_ptr<Client> client,
               ConsumerFactory consumer_factory)
        : options_(std::move(options)),
          precision_(precision),
          client_(std::move(client)),
          consumer_factory_(std::move(consumer_factory)) {}

    DbOptions options_;
    TimePrecision precision_;
    std::shared_ptr<Client> client_;
    ConsumerFactory consumer_factory_;
};

}  // namespace tsdb_pipe
