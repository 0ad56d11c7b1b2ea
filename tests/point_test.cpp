// SPDX-License-Identifier: MIT

// tests/point_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <string>

#include "src/point.hpp"

using namespace tsdb_pipe;
using namespace std::chrono_literals;

namespace {

Timestamp At(int64_t ns) {
    return Timestamp(std::chrono::nanoseconds(ns));
}

}  // namespace

TEST(ParsePrecisionTest, AcceptsKnownUnits) {
    EXPECT_EQ(ParsePrecision("ns").value(), TimePrecision::Nanoseconds);
    EXPECT_EQ(ParsePrecision("us").value(), TimePrecision::Microseconds);
    EXPECT_EQ(ParsePrecision("ms").value(), TimePrecision::Milliseconds);
    EXPECT_EQ(ParsePrecision("s").value(), TimePrecision::Seconds);
}

TEST(ParsePrecisionTest, RejectsUnknownUnits) {
    for (std::string_view unit : {"", "m", "h", "MS", "sec"}) {
        auto p = ParsePrecision(unit);
        ASSERT_FALSE(p.has_value()) << unit;
        EXPECT_EQ(p.error().code, ErrorCode::InvalidPrecision);
    }
}

TEST(ParsePrecisionTest, ToStringAndMultiplier) {
    static_assert(ToString(TimePrecision::Microseconds) == "us");
    static_assert(PrecisionMultiplier(TimePrecision::Seconds) == 1'000'000'000);
    EXPECT_EQ(ToString(TimePrecision::Milliseconds), "ms");
    EXPECT_EQ(PrecisionMultiplier(TimePrecision::Nanoseconds), 1);
}

TEST(PointTest, RejectsEmptyName) {
    auto p = Point::Create("", {}, {{"value", int64_t{1}}});
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, ErrorCode::InvalidPoint);
}

TEST(PointTest, RejectsEmptyFields) {
    auto p = Point::Create("cpu", {{"host", "a"}}, {});
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, ErrorCode::InvalidPoint);
}

TEST(PointTest, RejectsEmptyTagValueAndNonFiniteFloat) {
    EXPECT_FALSE(Point::Create("cpu", {{"host", ""}}, {{"v", 1.0}}).has_value());
    EXPECT_FALSE(Point::Create("cpu", {}, {{"", 1.0}}).has_value());
    EXPECT_FALSE(Point::Create("cpu", {}, {{"v", std::numeric_limits<double>::quiet_NaN()}})
                     .has_value());
    EXPECT_FALSE(Point::Create("cpu", {}, {{"v", std::numeric_limits<double>::infinity()}})
                     .has_value());
}

TEST(PointTest, RejectsIdentifiersThatBreakTheLine) {
    const Fields one{{"v", int64_t{1}}};
    EXPECT_FALSE(Point::Create("cpu", {{"host", "c:\\"}}, one).has_value());
    EXPECT_FALSE(Point::Create("cpu", {{"host\\", "a"}}, one).has_value());
    EXPECT_FALSE(Point::Create("cpu\\", {}, one).has_value());
    EXPECT_FALSE(Point::Create("cpu", {}, {{"a\\", int64_t{1}}, {"b", int64_t{2}}}).has_value());
    EXPECT_FALSE(Point::Create("cpu", {{"path", "a\\,b"}}, one).has_value());
    EXPECT_FALSE(Point::Create("cpu", {}, {{"k\\=", int64_t{1}}}).has_value());

    auto p = Point::Create("cpu", {{"host", "a\nb"}}, one);
    ASSERT_FALSE(p.has_value());
    EXPECT_EQ(p.error().code, ErrorCode::InvalidPoint);
    EXPECT_FALSE(Point::Create("cpu\rmem", {}, one).has_value());
    EXPECT_FALSE(Point::Create("cpu", {{"ho\nst", "a"}}, one).has_value());
    EXPECT_FALSE(Point::Create("cpu", {}, {{"v\n", int64_t{1}}}).has_value());
}

TEST(PointTest, KeepsInnerBackslashes) {
    auto p = Point::Create("disk\\io", {{"path", "c:\\temp\\\\x"}}, {{"a\\b", int64_t{1}}});
    ASSERT_TRUE(p.has_value()) << p.error().message;
    EXPECT_EQ(p->String(), "disk\\io,path=c:\\temp\\\\x a\\b=1i");
}

TEST(PointTest, SerializesSortedTagsAndFields) {
    auto p = Point::Create("cpu", {{"region", "eu"}, {"host", "a"}},
                           {{"value", 0.5}, {"count", int64_t{3}}}, At(1'000'000'000));
    ASSERT_TRUE(p.has_value()) << p.error().message;
    EXPECT_EQ(p->String(), "cpu,host=a,region=eu count=3i,value=0.5 1000000000");
}

TEST(PointTest, NoTimestampNoSuffix) {
    auto p = Point::Create("cpu", {}, {{"value", int64_t{1}}});
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->String(), "cpu value=1i");
    EXPECT_EQ(p->UnixNano(), 0);
    EXPECT_FALSE(p->Time().has_value());
}

TEST(PointTest, FieldValueFormats) {
    auto p = Point::Create("m", {},
                           {{"b", true},
                            {"f", false},
                            {"i", int64_t{-42}},
                            {"s", std::string("say \"hi\" \\o/")},
                            {"u", uint64_t{18446744073709551615ULL}}});
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->String(),
              "m b=true,f=false,i=-42i,s=\"say \\\"hi\\\" \\\\o/\",u=18446744073709551615u");
}

TEST(PointTest, FloatsNeverUseExponent) {
    EXPECT_EQ(FormatFieldValue(1e20), "100000000000000000000");
    EXPECT_EQ(FormatFieldValue(0.000001), "0.000001");
    EXPECT_EQ(FormatFieldValue(2.0), "2");
    EXPECT_EQ(FormatFieldValue(-3.25), "-3.25");
}

TEST(PointTest, EscapesNameTagsAndFieldKeys) {
    auto p = Point::Create("cpu load", {{"host name", "a,b"}}, {{"x=y", int64_t{1}}});
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->String(), "cpu\\ load,host\\ name=a\\,b x\\=y=1i");
}

TEST(PointTest, PrecisionStringTruncates) {
    auto p = Point::Create("cpu", {}, {{"v", int64_t{1}}}, At(1'704'067'200'123'456'789));
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->PrecisionString(TimePrecision::Nanoseconds), "cpu v=1i 1704067200123456789");
    EXPECT_EQ(p->PrecisionString(TimePrecision::Microseconds), "cpu v=1i 1704067200123456");
    EXPECT_EQ(p->PrecisionString(TimePrecision::Milliseconds), "cpu v=1i 1704067200123");
    EXPECT_EQ(p->PrecisionString(TimePrecision::Seconds), "cpu v=1i 1704067200");
    EXPECT_EQ(p->UnixNano(), 1'704'067'200'123'456'789);
}

TEST(PointTest, AcceptsChronoTimePoint) {
    auto p = Point::Create("cpu", {}, {{"v", 1.5}},
                           std::chrono::sys_days{std::chrono::January / 1 / 2024} + 30s);
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->PrecisionString(TimePrecision::Seconds), "cpu v=1.5 1704067230");
}
