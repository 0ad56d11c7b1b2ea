// SPDX-License-Identifier: MIT

// src/line_protocol_parser.hpp
#pragma once

#include <expected>
#include <string_view>
#include <vector>

#include "lib/net/error.hpp"
#include "src/point.hpp"

namespace tsdb_pipe {

// Parse one line of line protocol back into a Point.
//
// The timestamp, when present, is read in the given precision. Integer
// fields need an 'i' or 'u' suffix; unsuffixed numbers parse as double.
// Booleans accept t, T, true, True, TRUE and the matching false spellings.
// Errors are reported as ParseError.
std::expected<Point, Error> ParsePoint(std::string_view line,
                                       TimePrecision precision = TimePrecision::Nanoseconds);

// Parse newline-separated lines, skipping empty lines and '#' comments.
std::expected<std::vector<Point>, Error> ParsePoints(
    std::string_view text, TimePrecision precision = TimePrecision::Nanoseconds);

}  // namespace tsdb_pipe
