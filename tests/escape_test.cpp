// SPDX-License-Identifier: MIT

// tests/escape_test.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "src/escape.hpp"

using namespace tsdb_pipe;

TEST(EscapeTest, EscapesReservedCharacters) {
    EXPECT_EQ(EscapeString("cpu load"), "cpu\\ load");
    EXPECT_EQ(EscapeString("a,b=c"), "a\\,b\\=c");
    EXPECT_EQ(EscapeString("say \"hi\""), "say\\ \\\"hi\\\"");
}

TEST(EscapeTest, PlainStringsUnchanged) {
    EXPECT_EQ(EscapeString("temperature"), "temperature");
    EXPECT_EQ(EscapeString(""), "");
    EXPECT_EQ(UnescapeString("temperature"), "temperature");
}

TEST(EscapeTest, UnescapeKeepsUnknownBackslash) {
    EXPECT_EQ(UnescapeString("C:\\path"), "C:\\path");
    EXPECT_EQ(UnescapeString("trailing\\"), "trailing\\");
    EXPECT_EQ(UnescapeString("a\\ b"), "a b");
}

TEST(EscapeTest, ReservedCharacterSet) {
    EXPECT_TRUE(IsReservedChar(','));
    EXPECT_TRUE(IsReservedChar('"'));
    EXPECT_TRUE(IsReservedChar(' '));
    EXPECT_TRUE(IsReservedChar('='));
    EXPECT_FALSE(IsReservedChar('\\'));
    EXPECT_FALSE(IsReservedChar('a'));
}

TEST(EscapeTest, RoundTripsEveryReservedString) {
    // Every string of length 0..4 over the reserved alphabet
    const std::string alphabet = ",\" =";
    std::vector<std::string> inputs{""};
    for (int len = 1; len <= 4; ++len) {
        std::vector<std::string> next;
        for (const auto& prefix : inputs) {
            if (static_cast<int>(prefix.size()) != len - 1) continue;
            for (char c : alphabet) {
                next.push_back(prefix + c);
            }
        }
        inputs.insert(inputs.end(), next.begin(), next.end());
    }
    ASSERT_EQ(inputs.size(), 1u + 4u + 16u + 64u + 256u);

    for (const auto& s : inputs) {
        std::string escaped = EscapeString(s);
        EXPECT_EQ(escaped.size(), s.size() * 2);
        EXPECT_EQ(UnescapeString(escaped), s) << "input: " << s;
    }
}

TEST(EscapeTest, RoundTripsMixedContent) {
    for (std::string s : {"host name", "a=b,c=d", "\"quoted\"", "x\\y", "  lead"}) {
        EXPECT_EQ(UnescapeString(EscapeString(s)), s) << "input: " << s;
    }
}
