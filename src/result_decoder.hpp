// SPDX-License-Identifier: MIT

// src/result_decoder.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lib/net/error.hpp"
#include "src/query_response.hpp"

namespace tsdb_pipe {

// Coercion family of a column, resolved once from its declared type name
enum class ColumnKind : uint8_t {
    SignedInteger,  // TINYINT, SMALLINT, INT, BIGINT and their UNSIGNED forms
    Float,          // FLOAT, DOUBLE
    Timestamp,      // TIMESTAMP
    Other,
};

ColumnKind ResolveColumnKind(std::string_view type_name);

struct DecodeOptions {
    bool convert_number = false;
    // Substituted when a numeric column holds a value that is not a number
    Value default_number{};
};

using Row = std::map<std::string, Value>;

// Project response rows into maps keyed by column name.
//
// Columns named "_" are skipped. With convert_number set, integer columns
// become int64_t, float columns double and TIMESTAMP columns Unix seconds.
// A numeric string coerces like a number; any other non-number value in a
// numeric column becomes default_number. Number text of the wrong shape
// (a fraction in an integer column) and unparsable timestamps become 0.
//
// Fails with DecodeError when any column metadata entry is not a
// [name, type, size] triple with string name and type, or a row is shorter
// than the column list.
std::expected<std::vector<Row>, Error> DecodeRows(const QueryResponse& response,
                                                  const DecodeOptions& options);

// Column names in metadata order, "_" included
std::expected<std::vector<std::string>, Error> ColumnNames(const QueryResponse& response);

// Parse "YYYY-MM-DDTHH:MM:SS[.fraction]Z" (any number of fraction digits) into Unix seconds
std::optional<int64_t> ParseTimestampSeconds(std::string_view text);

}  // namespace tsdb_pipe
