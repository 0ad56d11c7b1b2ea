// SPDX-License-Identifier: MIT

// src/query_response.cpp
#include "src/query_response.hpp"

#include <charconv>

#include <fmt/format.h>

namespace tsdb_pipe {

namespace {

constexpr int64_t kTableNotExistCode = 9826;
constexpr int64_t kStableNotExistCode = 9750;

}  // namespace

std::string FormatValue(const Value& value) {
    struct Formatter {
        std::string operator()(std::monostate) const { return "null"; }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(const Number& v) const { return v.text; }
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(int64_t v) const { return fmt::format("{}", v); }
        std::string operator()(double v) const { return fmt::format("{}", v); }
    };
    return std::visit(Formatter{}, value);
}

std::optional<Error> QueryResponse::ApplicationError() const {
    if (code == 0 && desc.empty()) return std::nullopt;
    if (code == kTableNotExistCode || code == kStableNotExistCode) {
        return TableNotExistsError();
    }
    return Error{ErrorCode::ApplicationError,
                 desc.empty() ? fmt::format("query failed with code {}", code) : desc};
}

void QueryResponseBuilder::Fail(std::string message) {
    if (error_.empty()) error_ = std::move(message);
}

std::vector<std::vector<Value>>& QueryResponseBuilder::Target() {
    return section_ == Section::ColumnMeta ? response_.column_meta : response_.data;
}

void QueryResponseBuilder::OnKey(std::string_view key) {
    if (skip_depth_ > 0 || depth_ != 1) return;
    key_ = std::string(key);
}

void QueryResponseBuilder::OnStartObject() {
    if (!error_.empty()) return;
    if (skip_depth_ > 0) {
        ++skip_depth_;
        return;
    }
    switch (depth_) {
        case 0:
            depth_ = 1;
            return;
        case 1:
            if (key_ == "code" || key_ == "desc" || key_ == "rows" ||
                key_ == "column_meta" || key_ == "data") {
                Fail(fmt::format("cannot decode object into field \"{}\"", key_));
                return;
            }
            skip_depth_ = 1;
            return;
        default:
            Fail("nested objects are not supported in response rows");
            return;
    }
}

void QueryResponseBuilder::OnEndObject() {
    if (!error_.empty()) return;
    if (skip_depth_ > 0) {
        --skip_depth_;
        return;
    }
    if (depth_ == 1) depth_ = 0;
}

void QueryResponseBuilder::OnStartArray() {
    if (!error_.empty()) return;
    if (skip_depth_ > 0) {
        ++skip_depth_;
        return;
    }
    switch (depth_) {
        case 0:
            Fail("response is not a JSON object");
            return;
        case 1:
            if (key_ == "column_meta") {
                section_ = Section::ColumnMeta;
            } else if (key_ == "data") {
                section_ = Section::Data;
            } else if (key_ == "code" || key_ == "desc" || key_ == "rows") {
                Fail(fmt::format("cannot decode array into field \"{}\"", key_));
                return;
            } else {
                skip_depth_ = 1;
                return;
            }
            Target().clear();
            depth_ = 2;
            return;
        case 2:
            Target().emplace_back();
            depth_ = 3;
            return;
        default:
            Fail("nested arrays are not supported in response rows");
            return;
    }
}

void QueryResponseBuilder::OnEndArray() {
    if (!error_.empty()) return;
    if (skip_depth_ > 0) {
        --skip_depth_;
        return;
    }
    if (depth_ == 3) {
        depth_ = 2;
    } else if (depth_ == 2) {
        depth_ = 1;
        section_ = Section::None;
    }
}

void QueryResponseBuilder::OnScalar(Value value) {
    if (!error_.empty() || skip_depth_ > 0) return;
    switch (depth_) {
        case 0:
            // A bare null decodes to an empty response
            if (!std::holds_alternative<std::monostate>(value)) {
                Fail("response is not a JSON object");
            }
            return;
        case 1:
            OnTopLevelValue(std::move(value));
            return;
        case 2:
            Fail(fmt::format("row of \"{}\" is not an array", key_));
            return;
        default:
            Target().back().push_back(std::move(value));
            return;
    }
}

void QueryResponseBuilder::OnTopLevelValue(Value value) {
    // null leaves a field at its zero value
    if (std::holds_alternative<std::monostate>(value)) return;

    if (key_ == "code" || key_ == "rows") {
        const auto* num = std::get_if<Number>(&value);
        int64_t parsed = 0;
        if (num == nullptr) {
            Fail(fmt::format("field \"{}\" is not a number", key_));
            return;
        }
        const char* end = num->text.data() + num->text.size();
        auto [ptr, ec] = std::from_chars(num->text.data(), end, parsed);
        if (ec != std::errc{} || ptr != end) {
            Fail(fmt::format("field \"{}\" is not an integer: {}", key_, num->text));
            return;
        }
        (key_ == "code" ? response_.code : response_.rows) = parsed;
    } else if (key_ == "desc") {
        const auto* s = std::get_if<std::string>(&value);
        if (s == nullptr) {
            Fail("field \"desc\" is not a string");
            return;
        }
        response_.desc = *s;
    } else if (key_ == "column_meta" || key_ == "data") {
        Fail(fmt::format("field \"{}\" is not an array", key_));
    }
}

std::expected<QueryResponse, std::string> QueryResponseBuilder::Build() {
    if (!error_.empty()) return std::unexpected(error_);
    return std::move(response_);
}

std::expected<QueryResponse, JsonError> ParseQueryResponse(std::string_view body) {
    QueryResponseBuilder builder;
    return ParseJson(body, builder);
}

}  // namespace tsdb_pipe
