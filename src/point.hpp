// SPDX-License-Identifier: MIT

// src/point.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "lib/net/error.hpp"

namespace tsdb_pipe {

// Field value types representable in line protocol.
// int64_t is written with an 'i' suffix, uint64_t with 'u'.
using FieldValue = std::variant<int64_t, uint64_t, double, bool, std::string>;

using Tags = std::map<std::string, std::string>;
using Fields = std::map<std::string, FieldValue>;
using Timestamp = std::chrono::sys_time<std::chrono::nanoseconds>;

// Time resolution used to interpret and emit timestamps
enum class TimePrecision : uint8_t {
    Nanoseconds,
    Microseconds,
    Milliseconds,
    Seconds,
};

// Parse "ns", "us", "ms" or "s"
std::expected<TimePrecision, Error> ParsePrecision(std::string_view unit);

constexpr std::string_view ToString(TimePrecision p) {
    switch (p) {
        case TimePrecision::Nanoseconds:
            return "ns";
        case TimePrecision::Microseconds:
            return "us";
        case TimePrecision::Milliseconds:
            return "ms";
        case TimePrecision::Seconds:
            return "s";
    }
    return "ms";
}

// Nanoseconds per unit of the given precision
constexpr int64_t PrecisionMultiplier(TimePrecision p) {
    switch (p) {
        case TimePrecision::Nanoseconds:
            return 1;
        case TimePrecision::Microseconds:
            return 1'000;
        case TimePrecision::Milliseconds:
            return 1'000'000;
        case TimePrecision::Seconds:
            return 1'000'000'000;
    }
    return 1;
}

// Point - one immutable measurement
//
// Serialized form:
//   name[,tag=value...] field=value[,field=value...] [timestamp]
// Tags and fields are written in key order. A point without a timestamp lets
// the server assign the reception time.
class Point {
public:
    // Fails with InvalidPoint when the name or fields are empty, a tag key,
    // tag value or field key is empty, or a float field is NaN or infinite.
    // Names, tag keys, tag values and field keys must not hold a line break,
    // end in a backslash, or put a backslash before ',', '"', ' ' or '='.
    static std::expected<Point, Error> Create(std::string name, Tags tags, Fields fields,
                                              std::optional<Timestamp> time = std::nullopt);

    const std::string& Name() const { return name_; }
    const Tags& GetTags() const { return tags_; }
    const Fields& GetFields() const { return fields_; }
    const std::optional<Timestamp>& Time() const { return time_; }

    // Nanoseconds since the Unix epoch, 0 when no timestamp is set
    int64_t UnixNano() const;

    // Line protocol with a nanosecond timestamp
    std::string String() const;

    // Line protocol with the timestamp truncated to the given precision
    std::string PrecisionString(TimePrecision precision) const;

private:
    Point(std::string name, Tags tags, Fields fields, std::optional<Timestamp> time)
        : name_(std::move(name)),
          tags_(std::move(tags)),
          fields_(std::move(fields)),
          time_(time) {}

    std::string name_;
    Tags tags_;
    Fields fields_;
    std::optional<Timestamp> time_;
};

// Format a single field value the way it appears after "key="
std::string FormatFieldValue(const FieldValue& value);

}  // namespace tsdb_pipe
