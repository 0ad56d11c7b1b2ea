// SPDX-License-Identifier: MIT

// example/tsdb_cli/main.cpp
//
// Command-line client: ping the server, run a query or write line protocol.
//
//   tsdb_cli --ping
//   tsdb_cli --query "select * from meters limit 3" --convert
//   tsdb_cli --write "meters,location=lab current=1.5,voltage=220i 1704067200000"

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include <nitro/broken_options/parser.hpp>

#include "src/batch_points.hpp"
#include "src/line_protocol_parser.hpp"
#include "src/log.hpp"
#include "src/options.hpp"
#include "src/tsdb_client.hpp"

using namespace tsdb_pipe;

namespace {

int RunQuery(TsdbClient& client, const std::string& sql, bool convert) {
    auto rows = client.QueryData(sql, convert);
    if (!rows) {
        Log::error() << "query failed [" << error_category(rows.error().code) << "]: "
                     << rows.error().message;
        return 1;
    }
    for (const auto& row : *rows) {
        bool first = true;
        for (const auto& [column, value] : row) {
            std::cout << (first ? "" : "\t") << column << "=" << FormatValue(value);
            first = false;
        }
        std::cout << '\n';
    }
    Log::info() << rows->size() << " row(s)";
    return 0;
}

int RunWrite(TsdbClient& client, const std::string& text) {
    const auto& opts = client.Options();
    auto batch = BatchPoints::Create(BatchPointsConfig{opts.precision_unit, opts.database_name,
                                                       "", ""});
    if (!batch) {
        Log::error() << batch.error().message;
        return 1;
    }

    auto points = ParsePoints(text, batch->Precision());
    if (!points) {
        Log::error() << points.error().message;
        return 1;
    }
    for (auto& point : *points) {
        batch->AddPoint(std::make_unique<Point>(std::move(point)));
    }

    if (auto r = client.HttpClient()->Write(*batch); !r) {
        Log::error() << "write failed [" << error_category(r.error().code) << "]: "
                     << r.error().message;
        return 1;
    }
    Log::info() << "wrote " << batch->Points().size() << " point(s)";
    return 0;
}

int RunPing(TsdbClient& client) {
    auto pong = client.HttpClient()->Ping();
    if (!pong) {
        Log::error() << "ping failed: " << pong.error().message;
        return 1;
    }
    std::cout << "server version " << pong->version << " in "
              << std::chrono::duration_cast<std::chrono::milliseconds>(pong->duration).count()
              << "ms\n";
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    SetLogLevel(nitro::log::severity_level::info);

    const DbOptions env = DbOptions::FromEnvironment();

    nitro::broken_options::parser parser;
    parser.option("addr", "Database REST address.").default_value(env.database_addr).short_name("a");
    parser.option("db", "Database name.").default_value(env.database_name).short_name("d");
    parser.option("user", "User name.").default_value(env.database_user).short_name("u");
    parser.option("password", "Password.").default_value(env.database_pass).short_name("p");
    parser.option("precision", "Timestamp precision: ns, us, ms or s.")
        .default_value(env.precision_unit);
    parser.option("query", "SQL to run.").default_value("").short_name("e");
    parser.option("write", "Line protocol to write, one point per line.").default_value("");
    parser.toggle("ping", "Print the server version.");
    parser.toggle("convert", "Convert numeric and timestamp columns.");
    parser.toggle("gzip", "Compress writes with gzip.");
    parser.toggle("insecure", "Skip TLS certificate verification.");
    parser.toggle("verbose").short_name("v");
    parser.toggle("quiet").short_name("q");
    parser.toggle("help").short_name("h");

    try {
        auto options = parser.parse(argc, argv);

        if (options.given("help")) {
            parser.usage();
            return 0;
        }
        if (options.given("verbose")) {
            SetLogLevel(nitro::log::severity_level::debug);
        } else if (options.given("quiet")) {
            SetLogLevel(nitro::log::severity_level::warn);
        }

        DbOptions db = env;
        db.database_addr = options.get("addr");
        db.database_name = options.get("db");
        db.database_user = options.get("user");
        db.database_pass = options.get("password");
        db.precision_unit = options.get("precision");
        db.write_encoding = options.given("gzip") ? "gzip" : "";
        db.insecure_skip_verify = options.given("insecure");

        auto client = TsdbClient::Create(std::move(db));
        if (!client) {
            Log::error() << "invalid configuration: " << client.error().message;
            return 1;
        }

        int rc = 0;
        if (options.given("ping")) {
            rc = RunPing(**client);
        } else if (!options.get("query").empty()) {
            rc = RunQuery(**client, options.get("query"), options.given("convert"));
        } else if (!options.get("write").empty()) {
            rc = RunWrite(**client, options.get("write"));
        } else {
            parser.usage();
        }
        (*client)->Close();
        return rc;
    } catch (nitro::broken_options::parsing_error& e) {
        Log::warn() << e.what();
        parser.usage();
        return 1;
    } catch (nitro::broken_options::parser_error& e) {
        Log::error() << "broken options are broken " << e.what();
        return 1;
    }
}
