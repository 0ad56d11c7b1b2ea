// SPDX-License-Identifier: MIT

// src/batch_points.cpp
#include "src/batch_points.hpp"

namespace tsdb_pipe {

std::expected<BatchPoints, Error> BatchPoints::Create(const BatchPointsConfig& config) {
    auto precision = ParsePrecision(config.precision.empty() ? "ms" : config.precision);
    if (!precision) return std::unexpected(precision.error());
    return BatchPoints(*precision, config.database, config.retention_policy,
                       config.write_consistency);
}

std::expected<void, Error> BatchPoints::SetPrecision(std::string_view unit) {
    auto precision = ParsePrecision(unit);
    if (!precision) return std::unexpected(precision.error());
    precision_ = *precision;
    return {};
}

}  // namespace tsdb_pipe
