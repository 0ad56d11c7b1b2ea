// SPDX-License-Identifier: MIT

// tests/batch_points_test.cpp
#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "src/batch_points.hpp"

using namespace tsdb_pipe;

namespace {

std::unique_ptr<Point> MakePoint(std::string name, int64_t value) {
    auto p = Point::Create(std::move(name), {}, {{"value", value}});
    return std::make_unique<Point>(std::move(*p));
}

}  // namespace

TEST(BatchPointsTest, DefaultsToMilliseconds) {
    auto batch = BatchPoints::Create(BatchPointsConfig{"", "iot", "", ""});
    ASSERT_TRUE(batch.has_value()) << batch.error().message;
    EXPECT_EQ(batch->Precision(), TimePrecision::Milliseconds);
    EXPECT_EQ(batch->Database(), "iot");
    EXPECT_TRUE(batch->Points().empty());

    auto defaults = BatchPoints::Create(BatchPointsConfig{});
    ASSERT_TRUE(defaults.has_value());
    EXPECT_EQ(defaults->Precision(), TimePrecision::Milliseconds);
}

TEST(BatchPointsTest, CreateRejectsInvalidPrecision) {
    auto batch = BatchPoints::Create(BatchPointsConfig{"minutes", "iot", "", ""});
    ASSERT_FALSE(batch.has_value());
    EXPECT_EQ(batch.error().code, ErrorCode::InvalidPrecision);
}

TEST(BatchPointsTest, PreservesInsertionOrder) {
    auto batch = BatchPoints::Create(BatchPointsConfig{"s", "iot", "autogen", "one"});
    ASSERT_TRUE(batch.has_value());

    batch->AddPoint(MakePoint("b", 1));
    std::vector<std::unique_ptr<Point>> more;
    more.push_back(MakePoint("a", 2));
    more.push_back(nullptr);
    more.push_back(MakePoint("b", 1));
    batch->AddPoints(std::move(more));

    const auto& points = batch->Points();
    ASSERT_EQ(points.size(), 4u);
    EXPECT_EQ(points[0]->Name(), "b");
    EXPECT_EQ(points[1]->Name(), "a");
    EXPECT_EQ(points[2], nullptr);
    EXPECT_EQ(points[3]->Name(), "b");
    EXPECT_EQ(batch->RetentionPolicy(), "autogen");
    EXPECT_EQ(batch->WriteConsistency(), "one");
}

TEST(BatchPointsTest, SetPrecision) {
    auto batch = BatchPoints::Create(BatchPointsConfig{});
    ASSERT_TRUE(batch.has_value());
    ASSERT_TRUE(batch->SetPrecision("us").has_value());
    EXPECT_EQ(batch->Precision(), TimePrecision::Microseconds);
}

TEST(BatchPointsTest, InvalidSetPrecisionKeepsPreviousValue) {
    auto batch = BatchPoints::Create(BatchPointsConfig{"ns", "", "", ""});
    ASSERT_TRUE(batch.has_value());

    auto result = batch->SetPrecision("fortnight");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidPrecision);
    EXPECT_EQ(batch->Precision(), TimePrecision::Nanoseconds);

    result = batch->SetPrecision("");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(batch->Precision(), TimePrecision::Nanoseconds);
}

TEST(BatchPointsTest, Setters) {
    auto batch = BatchPoints::Create(BatchPointsConfig{});
    ASSERT_TRUE(batch.has_value());
    batch->SetDatabase("metrics");
    batch->SetRetentionPolicy("week");
    batch->SetWriteConsistency("all");
    EXPECT_EQ(batch->Database(), "metrics");
    EXPECT_EQ(batch->RetentionPolicy(), "week");
    EXPECT_EQ(batch->WriteConsistency(), "all");
}
