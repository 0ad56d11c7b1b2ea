// SPDX-License-Identifier: MIT

// src/result_decoder.cpp
#include "src/result_decoder.hpp"

#include <chrono>
#include <charconv>

#include <fmt/format.h>

namespace tsdb_pipe {

namespace {

struct ColumnPlan {
    std::string name;
    ColumnKind kind;
    bool skip;
};

std::expected<std::vector<ColumnPlan>, Error> PlanColumns(const QueryResponse& response) {
    std::vector<ColumnPlan> plan;
    plan.reserve(response.column_meta.size());
    for (size_t i = 0; i < response.column_meta.size(); ++i) {
        const auto& meta = response.column_meta[i];
        if (meta.size() != 3) {
            return std::unexpected(Error{ErrorCode::DecodeError,
                fmt::format("column meta data length no equal 3 (column {} has {})",
                            i, meta.size())});
        }
        const auto* name = std::get_if<std::string>(&meta[0]);
        const auto* type = std::get_if<std::string>(&meta[1]);
        if (name == nullptr || type == nullptr) {
            return std::unexpected(Error{ErrorCode::DecodeError,
                fmt::format("column {} name or type is not a string", i)});
        }
        plan.push_back(ColumnPlan{*name, ResolveColumnKind(*type), *name == "_"});
    }
    return plan;
}

template <typename T>
T ParseNumberOrZero(const std::string& text) {
    T out{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, out);
    if (ec != std::errc{} || ptr != end) return T{};
    return out;
}

// Strings are accepted when the whole text is a number of the right kind
template <typename T>
Value CoerceNumber(const Value& raw, const DecodeOptions& options) {
    if (const auto* num = std::get_if<Number>(&raw)) {
        return ParseNumberOrZero<T>(num->text);
    }
    if (const auto* s = std::get_if<std::string>(&raw)) {
        T out{};
        const char* end = s->data() + s->size();
        auto [ptr, ec] = std::from_chars(s->data(), end, out);
        if (!s->empty() && ec == std::errc{} && ptr == end) return out;
    }
    return options.default_number;
}

Value Coerce(const Value& raw, ColumnKind kind, const DecodeOptions& options) {
    switch (kind) {
        case ColumnKind::SignedInteger:
            return CoerceNumber<int64_t>(raw, options);
        case ColumnKind::Float:
            return CoerceNumber<double>(raw, options);
        case ColumnKind::Timestamp:
            if (const auto* s = std::get_if<std::string>(&raw)) {
                return ParseTimestampSeconds(*s).value_or(0);
            }
            return int64_t{0};
        case ColumnKind::Other:
            break;
    }
    return raw;
}

bool ParseDigits(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, out);
    return ec == std::errc{} && ptr == text.data() + pos + len;
}

}  // namespace

ColumnKind ResolveColumnKind(std::string_view type_name) {
    if (type_name == "BIGINT" || type_name == "INT" || type_name == "TINYINT" ||
        type_name == "SMALLINT" || type_name == "TINYINT UNSIGNED" ||
        type_name == "SMALLINT UNSIGNED" || type_name == "INT UNSIGNED" ||
        type_name == "BIGINT UNSIGNED") {
        return ColumnKind::SignedInteger;
    }
    if (type_name == "FLOAT" || type_name == "DOUBLE") return ColumnKind::Float;
    if (type_name == "TIMESTAMP") return ColumnKind::Timestamp;
    return ColumnKind::Other;
}

std::optional<int64_t> ParseTimestampSeconds(std::string_view text) {
    // 2024-01-01T00:00:00[.fraction]Z
    constexpr size_t kBaseLen = 19;
    if (text.size() < kBaseLen + 1 || text.back() != 'Z') return std::nullopt;
    if (text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }

    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!ParseDigits(text, 0, 4, y) || !ParseDigits(text, 5, 2, mo) ||
        !ParseDigits(text, 8, 2, d) || !ParseDigits(text, 11, 2, h) ||
        !ParseDigits(text, 14, 2, mi) || !ParseDigits(text, 17, 2, s)) {
        return std::nullopt;
    }

    std::string_view frac = text.substr(kBaseLen, text.size() - kBaseLen - 1);
    if (!frac.empty()) {
        if (frac.front() != '.' || frac.size() < 2) return std::nullopt;
        for (char c : frac.substr(1)) {
            if (c < '0' || c > '9') return std::nullopt;
        }
    }

    if (h > 23 || mi > 59 || s > 59) return std::nullopt;
    const std::chrono::year_month_day ymd{std::chrono::year{y},
                                          std::chrono::month{static_cast<unsigned>(mo)},
                                          std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    const auto days = std::chrono::sys_days{ymd}.time_since_epoch();
    return std::chrono::duration_cast<std::chrono::seconds>(days).count() +
           h * 3600 + mi * 60 + s;
}

std::expected<std::vector<std::string>, Error> ColumnNames(const QueryResponse& response) {
    auto plan = PlanColumns(response);
    if (!plan) return std::unexpected(plan.error());
    std::vector<std::string> names;
    names.reserve(plan->size());
    for (auto& column : *plan) {
        names.push_back(std::move(column.name));
    }
    return names;
}

std::expected<std::vector<Row>, Error> DecodeRows(const QueryResponse& response,
                                                  const DecodeOptions& options) {
    auto plan = PlanColumns(response);
    if (!plan) return std::unexpected(plan.error());

    std::vector<Row> rows;
    rows.reserve(response.data.size());
    for (size_t r = 0; r < response.data.size(); ++r) {
        const auto& raw = response.data[r];
        if (raw.size() < plan->size()) {
            return std::unexpected(Error{ErrorCode::DecodeError,
                fmt::format("row {} has {} values, expected {}", r, raw.size(), plan->size())});
        }

        Row row;
        for (size_t c = 0; c < plan->size(); ++c) {
            const auto& column = (*plan)[c];
            if (column.skip) continue;
            row[column.name] = options.convert_number
                ? Coerce(raw[c], column.kind, options)
                : raw[c];
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

}  // namespace tsdb_pipe
