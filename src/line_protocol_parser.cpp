// SPDX-License-Identifier: MIT

// src/line_protocol_parser.cpp
#include "src/line_protocol_parser.hpp"

#include <charconv>
#include <limits>
#include <string>

#include <fmt/format.h>

#include "src/escape.hpp"

namespace tsdb_pipe {

namespace {

Error ParseFailure(std::string_view line, std::string_view what) {
    return Error{ErrorCode::ParseError, fmt::format("unable to parse '{}': {}", line, what)};
}

// Index of the first character of `stops` in s[pos..] not preceded by a backslash
size_t ScanUnescaped(std::string_view s, size_t pos, std::string_view stops) {
    while (pos < s.size()) {
        char c = s[pos];
        if (c == '\\' && pos + 1 < s.size()) {
            pos += 2;
            continue;
        }
        if (stops.find(c) != std::string_view::npos) return pos;
        ++pos;
    }
    return pos;
}

template <typename T>
bool ParseWhole(std::string_view text, T& out) {
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

std::expected<FieldValue, std::string> ParseBareValue(std::string_view token) {
    if (token.empty()) return std::unexpected("missing field value");

    if (token == "t" || token == "T" || token == "true" || token == "True" ||
        token == "TRUE") {
        return FieldValue{true};
    }
    if (token == "f" || token == "F" || token == "false" || token == "False" ||
        token == "FALSE") {
        return FieldValue{false};
    }

    const char suffix = token.back();
    if (suffix == 'i') {
        int64_t v = 0;
        if (!ParseWhole(token.substr(0, token.size() - 1), v)) {
            return std::unexpected(fmt::format("invalid integer \"{}\"", token));
        }
        return FieldValue{v};
    }
    if (suffix == 'u') {
        uint64_t v = 0;
        if (!ParseWhole(token.substr(0, token.size() - 1), v)) {
            return std::unexpected(fmt::format("invalid unsigned integer \"{}\"", token));
        }
        return FieldValue{v};
    }

    double d = 0;
    if (!ParseWhole(token, d)) {
        return std::unexpected(fmt::format("invalid number \"{}\"", token));
    }
    return FieldValue{d};
}

std::string UnquoteFieldString(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] == '\\' && i + 1 < raw.size() && (raw[i + 1] == '"' || raw[i + 1] == '\\')) {
            ++i;
        }
        out += raw[i];
    }
    return out;
}

}  // namespace

std::expected<Point, Error> ParsePoint(std::string_view line, TimePrecision precision) {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }

    size_t pos = ScanUnescaped(line, 0, ", ");
    std::string name = UnescapeString(line.substr(0, pos));
    if (name.empty()) return std::unexpected(ParseFailure(line, "missing measurement"));

    Tags tags;
    while (pos < line.size() && line[pos] == ',') {
        size_t key_end = ScanUnescaped(line, pos + 1, "=, ");
        if (key_end >= line.size() || line[key_end] != '=') {
            return std::unexpected(ParseFailure(line, "missing tag value"));
        }
        size_t value_end = ScanUnescaped(line, key_end + 1, ", ");
        tags.insert_or_assign(UnescapeString(line.substr(pos + 1, key_end - pos - 1)),
                              UnescapeString(line.substr(key_end + 1, value_end - key_end - 1)));
        pos = value_end;
    }

    if (pos >= line.size() || line[pos] != ' ') {
        return std::unexpected(ParseFailure(line, "missing fields"));
    }
    while (pos < line.size() && line[pos] == ' ') ++pos;

    Fields fields;
    for (;;) {
        size_t key_end = ScanUnescaped(line, pos, "=, ");
        if (key_end >= line.size() || line[key_end] != '=') {
            return std::unexpected(ParseFailure(line, "missing field value"));
        }
        std::string key = UnescapeString(line.substr(pos, key_end - pos));
        pos = key_end + 1;

        if (pos < line.size() && line[pos] == '"') {
            size_t i = pos + 1;
            while (i < line.size() && line[i] != '"') {
                i += (line[i] == '\\' && i + 1 < line.size()) ? 2 : 1;
            }
            if (i >= line.size()) {
                return std::unexpected(ParseFailure(line, "unterminated string field"));
            }
            fields.insert_or_assign(std::move(key),
                                    UnquoteFieldString(line.substr(pos + 1, i - pos - 1)));
            pos = i + 1;
        } else {
            size_t value_end = ScanUnescaped(line, pos, ", ");
            auto value = ParseBareValue(line.substr(pos, value_end - pos));
            if (!value) return std::unexpected(ParseFailure(line, value.error()));
            fields.insert_or_assign(std::move(key), std::move(*value));
            pos = value_end;
        }

        if (pos < line.size() && line[pos] == ',') {
            ++pos;
            continue;
        }
        break;
    }

    while (pos < line.size() && line[pos] == ' ') ++pos;

    std::optional<Timestamp> time;
    if (pos < line.size()) {
        std::string_view ts_text = line.substr(pos);
        while (!ts_text.empty() && ts_text.back() == ' ') ts_text.remove_suffix(1);
        int64_t ts = 0;
        if (!ParseWhole(ts_text, ts)) {
            return std::unexpected(ParseFailure(line, "invalid timestamp"));
        }
        const int64_t mult = PrecisionMultiplier(precision);
        if (ts > std::numeric_limits<int64_t>::max() / mult ||
            ts < std::numeric_limits<int64_t>::min() / mult) {
            return std::unexpected(ParseFailure(line, "timestamp out of range"));
        }
        time = Timestamp(std::chrono::nanoseconds(ts * mult));
    }

    return Point::Create(std::move(name), std::move(tags), std::move(fields), time);
}

std::expected<std::vector<Point>, Error> ParsePoints(std::string_view text,
                                                     TimePrecision precision) {
    std::vector<Point> points;
    while (!text.empty()) {
        size_t eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);

        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string_view::npos || line[first] == '#') continue;

        auto point = ParsePoint(line.substr(first), precision);
        if (!point) return std::unexpected(point.error());
        points.push_back(std::move(*point));
    }
    return points;
}

}  // namespace tsdb_pipe
