// SPDX-License-Identifier: MIT

// src/batch_points.hpp
#pragma once

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "lib/net/error.hpp"
#include "src/point.hpp"

namespace tsdb_pipe {

struct BatchPointsConfig {
    std::string precision = "ms";  // empty means "ms"
    std::string database;
    std::string retention_policy;
    std::string write_consistency;
};

// BatchPoints - ordered group of points written together
//
// Insertion order is preserved; duplicates and null entries are allowed
// (writers skip nulls). Retention policy and write consistency are carried
// but not interpreted.
//
// Thread safety: not thread-safe. Use one batch per writer.
class BatchPoints {
public:
    static std::expected<BatchPoints, Error> Create(const BatchPointsConfig& config);

    BatchPoints(BatchPoints&&) = default;
    BatchPoints& operator=(BatchPoints&&) = default;

    void AddPoint(std::unique_ptr<Point> point) { points_.push_back(std::move(point)); }

    void AddPoints(std::vector<std::unique_ptr<Point>> points) {
        for (auto& p : points) {
            points_.push_back(std::move(p));
        }
    }

    const std::vector<std::unique_ptr<Point>>& Points() const { return points_; }

    TimePrecision Precision() const { return precision_; }

    // Leaves the current precision untouched when the unit is invalid
    std::expected<void, Error> SetPrecision(std::string_view unit);

    const std::string& Database() const { return database_; }
    void SetDatabase(std::string database) { database_ = std::move(database); }

    const std::string& RetentionPolicy() const { return retention_policy_; }
    void SetRetentionPolicy(std::string rp) { retention_policy_ = std::move(rp); }

    const std::string& WriteConsistency() const { return write_consistency_; }
    void SetWriteConsistency(std::string wc) { write_consistency_ = std::move(wc); }

private:
    BatchPoints(TimePrecision precision, std::string database, std::string retention_policy,
                std::string write_consistency)
        : precision_(precision),
          database_(std::move(database)),
          retention_policy_(std::move(retention_policy)),
          write_consistency_(std::move(write_consistency)) {}

    std::vector<std::unique_ptr<Point>> points_;
    TimePrecision precision_;
    std::string database_;
    std::string retention_policy_;
    std::string write_consistency_;
};

}  // namespace tsdb_pipe
