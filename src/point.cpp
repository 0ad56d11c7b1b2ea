// SPDX-License-Identifier: MIT

// src/point.cpp
#include "src/point.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <iterator>

#include <fmt/format.h>

#include "src/escape.hpp"

namespace tsdb_pipe {

namespace {

// A line break would split the line, and a backslash before a reserved
// character or at the end would read as an escape once serialized.
bool IsWritableIdentifier(std::string_view s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\n' || s[i] == '\r') return false;
        if (s[i] == '\\' && (i + 1 == s.size() || IsReservedChar(s[i + 1]))) return false;
    }
    return true;
}

Error UnwritableIdentifier(std::string_view what, std::string_view value) {
    return Error{ErrorCode::InvalidPoint,
                 fmt::format("{} {:?} cannot be written as line protocol", what, value)};
}

}  // namespace

std::expected<TimePrecision, Error> ParsePrecision(std::string_view unit) {
    if (unit == "ns") return TimePrecision::Nanoseconds;
    if (unit == "us") return TimePrecision::Microseconds;
    if (unit == "ms") return TimePrecision::Milliseconds;
    if (unit == "s") return TimePrecision::Seconds;
    return std::unexpected(Error{ErrorCode::InvalidPrecision,
        fmt::format("invalid precision unit \"{}\", expected one of ns, us, ms, s", unit)});
}

std::expected<Point, Error> Point::Create(std::string name, Tags tags, Fields fields,
                                          std::optional<Timestamp> time) {
    if (name.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidPoint, "point name is empty"});
    }
    if (!IsWritableIdentifier(name)) {
        return std::unexpected(UnwritableIdentifier("point name", name));
    }
    if (fields.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidPoint,
            fmt::format("point \"{}\" has no fields", name)});
    }
    for (const auto& [key, value] : tags) {
        if (key.empty() || value.empty()) {
            return std::unexpected(Error{ErrorCode::InvalidPoint,
                fmt::format("point \"{}\" has an empty tag key or value", name)});
        }
        if (!IsWritableIdentifier(key)) {
            return std::unexpected(UnwritableIdentifier("tag key", key));
        }
        if (!IsWritableIdentifier(value)) {
            return std::unexpected(UnwritableIdentifier("tag value", value));
        }
    }
    for (const auto& [key, value] : fields) {
        if (key.empty()) {
            return std::unexpected(Error{ErrorCode::InvalidPoint,
                fmt::format("point \"{}\" has an empty field key", name)});
        }
        if (!IsWritableIdentifier(key)) {
            return std::unexpected(UnwritableIdentifier("field key", key));
        }
        if (const auto* d = std::get_if<double>(&value); d != nullptr && !std::isfinite(*d)) {
            return std::unexpected(Error{ErrorCode::InvalidPoint,
                fmt::format("field \"{}\" of point \"{}\" is not a finite number", key, name)});
        }
    }
    return Point(std::move(name), std::move(tags), std::move(fields), time);
}

int64_t Point::UnixNano() const {
    if (!time_) return 0;
    return time_->time_since_epoch().count();
}

std::string Point::String() const {
    return PrecisionString(TimePrecision::Nanoseconds);
}

std::string Point::PrecisionString(TimePrecision precision) const {
    std::string out = EscapeString(name_);
    for (const auto& [key, value] : tags_) {
        out += ',';
        out += EscapeString(key);
        out += '=';
        out += EscapeString(value);
    }

    char sep = ' ';
    for (const auto& [key, value] : fields_) {
        out += sep;
        sep = ',';
        out += EscapeString(key);
        out += '=';
        out += FormatFieldValue(value);
    }

    if (time_) {
        fmt::format_to(std::back_inserter(out), " {}",
                       UnixNano() / PrecisionMultiplier(precision));
    }
    return out;
}

std::string FormatFieldValue(const FieldValue& value) {
    struct Formatter {
        std::string operator()(int64_t v) const { return fmt::format("{}i", v); }
        std::string operator()(uint64_t v) const { return fmt::format("{}u", v); }
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(double v) const {
            // Shortest representation that round-trips, never exponent notation
            std::array<char, 512> buf;
            auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), v,
                                           std::chars_format::fixed);
            if (ec != std::errc{}) return fmt::format("{}", v);
            return std::string(buf.data(), ptr);
        }
        std::string operator()(const std::string& v) const {
            std::string out;
            out.reserve(v.size() + 2);
            out += '"';
            for (char c : v) {
                if (c == '"' || c == '\\') out += '\\';
                out += c;
            }
            out += '"';
            return out;
        }
    };
    return std::visit(Formatter{}, value);
}

}  // namespace tsdb_pipe
