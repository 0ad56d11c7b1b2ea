// SPDX-License-Identifier: MIT

// src/query_response.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "lib/net/error.hpp"
#include "lib/net/json_parser.hpp"

namespace tsdb_pipe {

// Numeric text exactly as it appeared on the wire
struct Number {
    std::string text;

    bool operator==(const Number&) const = default;
};

// A cell value. Raw responses only hold null, bool, Number and string;
// int64_t and double appear after typed coercion.
using Value = std::variant<std::monostate, bool, Number, std::string, int64_t, double>;

// Render a value for display. Null renders as "null", strings unquoted.
std::string FormatValue(const Value& value);

// Response body of the SQL endpoint:
//   {"code":0,"desc":"","column_meta":[[name,type,size],...],"data":[[...],...],"rows":N}
struct QueryResponse {
    int64_t code = 0;
    std::string desc;
    std::vector<std::vector<Value>> column_meta;
    std::vector<std::vector<Value>> data;
    int64_t rows = 0;

    // Set when the payload reports failure (non-zero code or a description).
    // Codes 9826 and 9750 yield TableNotExistsError().
    std::optional<Error> ApplicationError() const;
};

// Builds a QueryResponse from JSON events. Unknown keys are skipped.
class QueryResponseBuilder {
public:
    using Result = QueryResponse;

    void OnKey(std::string_view key);
    void OnString(std::string_view value) { OnScalar(std::string(value)); }
    void OnNumber(std::string_view text) { OnScalar(Number{std::string(text)}); }
    void OnBool(bool value) { OnScalar(value); }
    void OnNull() { OnScalar(std::monostate{}); }
    void OnStartObject();
    void OnEndObject();
    void OnStartArray();
    void OnEndArray();

    std::expected<QueryResponse, std::string> Build();

private:
    enum class Section { None, ColumnMeta, Data };

    void OnScalar(Value value);
    void OnTopLevelValue(Value value);
    void Fail(std::string message);
    std::vector<std::vector<Value>>& Target();

    QueryResponse response_;
    std::string key_;
    std::string error_;
    Section section_ = Section::None;
    int depth_ = 0;        // 1 = top-level object, 2 = section array, 3 = row
    int skip_depth_ = 0;   // > 0 while inside a skipped value
};

// Decode a response body, keeping numbers as text
std::expected<QueryResponse, JsonError> ParseQueryResponse(std::string_view body);

}  // namespace tsdb_pipe
