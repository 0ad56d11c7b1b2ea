// SPDX-License-Identifier: MIT

// tests/log_test.cpp
#include <gtest/gtest.h>

#include <string>

#include "src/log.hpp"

using namespace tsdb_pipe;

namespace {

struct FakeRecord {
    std::string jiffy_text = "2024-01-01T00:00:00.000";
    std::string severity_text = "warn";
    std::string tag_text;
    std::string message_text;

    const std::string& jiffy() const { return jiffy_text; }
    const std::string& severity() const { return severity_text; }
    const std::string& tag() const { return tag_text; }
    const std::string& message() const { return message_text; }
};

}  // namespace

TEST(LineFormatterTest, TaggedRecord) {
    FakeRecord r;
    r.tag_text = "subscribe";
    r.message_text = "message channel full, dropping message";
    log_detail::LineFormatter<FakeRecord> formatter;
    EXPECT_EQ(formatter.format(r),
              "2024-01-01T00:00:00.000 warn subscribe: message channel full, dropping message\n");
}

TEST(LineFormatterTest, UntaggedRecord) {
    FakeRecord r;
    r.severity_text = "error";
    r.message_text = "query failed";
    log_detail::LineFormatter<FakeRecord> formatter;
    EXPECT_EQ(formatter.format(r), "2024-01-01T00:00:00.000 error: query failed\n");
}
