// SPDX-License-Identifier: MIT

// tests/gzip_test.cpp
#include <gtest/gtest.h>

#include <string>

#include "lib/net/gzip.hpp"

using namespace tsdb_pipe;

TEST(GzipTest, CompressProducesGzipMember) {
    auto compressed = GzipCompress("cpu,host=a value=1i 1\n");
    ASSERT_TRUE(compressed.has_value()) << compressed.error().message;
    ASSERT_GE(compressed->size(), 18u);
    // RFC 1952 magic and deflate method
    EXPECT_EQ(static_cast<unsigned char>((*compressed)[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>((*compressed)[1]), 0x8b);
    EXPECT_EQ(static_cast<unsigned char>((*compressed)[2]), 0x08);
}

TEST(GzipTest, DecompressRestoresInput) {
    std::string lines;
    for (int i = 0; i < 1000; ++i) {
        lines += "cpu,host=server" + std::to_string(i % 7) + " value=" + std::to_string(i) +
                 "i " + std::to_string(1704067200000 + i) + "\n";
    }
    auto compressed = GzipCompress(lines);
    ASSERT_TRUE(compressed.has_value());
    EXPECT_LT(compressed->size(), lines.size());

    auto restored = GzipDecompress(*compressed);
    ASSERT_TRUE(restored.has_value()) << restored.error().message;
    EXPECT_EQ(*restored, lines);
}

TEST(GzipTest, EmptyInput) {
    auto compressed = GzipCompress("");
    ASSERT_TRUE(compressed.has_value());
    EXPECT_FALSE(compressed->empty());

    auto restored = GzipDecompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_TRUE(restored->empty());
}

TEST(GzipTest, DecompressRejectsGarbage) {
    auto restored = GzipDecompress("definitely not gzip");
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::CompressionError);
}

TEST(GzipTest, DecompressRejectsTruncatedStream) {
    auto compressed = GzipCompress("some line protocol payload\n");
    ASSERT_TRUE(compressed.has_value());
    auto restored = GzipDecompress(std::string_view(*compressed).substr(0, compressed->size() / 2));
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::CompressionError);
}

TEST(GzipTest, InputFedInSlices) {
    std::string lines;
    for (int i = 0; i < 500; ++i) {
        lines += "mem,host=h" + std::to_string(i) + " used=" + std::to_string(i * 3) + "i\n";
    }

    // Slices far smaller than the payload stand in for bodies past 4 GiB
    auto compressed = detail::GzipCompress(lines, 7);
    ASSERT_TRUE(compressed.has_value()) << compressed.error().message;
    EXPECT_EQ(GzipDecompress(*compressed).value(), lines);

    auto restored = detail::GzipDecompress(*compressed, 3);
    ASSERT_TRUE(restored.has_value()) << restored.error().message;
    EXPECT_EQ(*restored, lines);

    auto whole = GzipCompress(lines);
    ASSERT_TRUE(whole.has_value());
    EXPECT_EQ(detail::GzipDecompress(*whole, 1).value(), lines);
}

TEST(GzipTest, TruncatedStreamFedInSlices) {
    auto compressed = GzipCompress("some line protocol payload\n");
    ASSERT_TRUE(compressed.has_value());
    auto restored = detail::GzipDecompress(
        std::string_view(*compressed).substr(0, compressed->size() - 4), 5);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code, ErrorCode::CompressionError);
}
