#include <gtest/gtest.h>
#include <stashy/language_detector.hpp>
#include <stashy/result.hpp>
#include <stashy/types.hpp>

using namespace stashy;

// ============================================================================
// Timestamps
// ============================================================================

TEST(TimestampTest, ParsesUtcWithZ) {
    auto ts = parse_timestamp("2024-05-01T12:30:00Z");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2024-05-01 12:30");
}

TEST(TimestampTest, AppliesOffset) {
    auto ts = parse_timestamp("2024-05-01T14:30:00+02:00");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2024-05-01 12:30");

    auto west = parse_timestamp("2024-04-30T23:00:00-0130");
    ASSERT_TRUE(west.has_value());
    EXPECT_EQ(format_timestamp(*west), "2024-05-01 00:30");
}

TEST(TimestampTest, AcceptsFractionalSecondsAndNaiveTimes) {
    auto a = parse_timestamp("2024-05-01T12:30:00.123456Z");
    auto b = parse_timestamp("2024-05-01 12:30:00");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_GT(*a, *b);
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(*a - *b).count(), 123);
}

TEST(TimestampTest, DateOnly) {
    auto ts = parse_timestamp("2000-02-29");
    ASSERT_TRUE(ts.has_value());
    EXPECT_EQ(format_timestamp(*ts), "2000-02-29 00:00");
}

TEST(TimestampTest, RejectsGarbage) {
    EXPECT_FALSE(parse_timestamp("").has_value());
    EXPECT_FALSE(parse_timestamp("yesterday").has_value());
    EXPECT_FALSE(parse_timestamp("2024-13-01T00:00:00Z").has_value());
    EXPECT_FALSE(parse_timestamp("2024-05-01T12:30:00Zjunk").has_value());
}

TEST(TimestampTest, OrderingFollowsInstants) {
    auto earlier = parse_timestamp("2023-12-31T23:59:59Z");
    auto later = parse_timestamp("2024-01-01T00:00:00Z");
    ASSERT_TRUE(earlier && later);
    EXPECT_LT(*earlier, *later);
}

// ============================================================================
// Enumerations
// ============================================================================

TEST(TypesTest, SortOrderNames) {
    for (auto order : {SortOrder::NEWEST, SortOrder::OLDEST, SortOrder::ALPHA_ASC,
                       SortOrder::ALPHA_DESC}) {
        auto parsed = parse_sort_order(sort_order_name(order));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, order);
    }
    EXPECT_FALSE(parse_sort_order("alphabetical").has_value());
}

TEST(TypesTest, Visibility) {
    EXPECT_STREQ(visibility_name(Visibility::PUBLIC), "public");
    EXPECT_EQ(parse_visibility("private"), Visibility::PRIVATE);
    EXPECT_FALSE(parse_visibility("Public").has_value());
}

TEST(TypesTest, ConfigDefaults) {
    Config config;
    EXPECT_TRUE(config.server_url.empty());
    EXPECT_EQ(config.default_page_size, 20u);
    EXPECT_EQ(config.timeout_seconds, 30);
    EXPECT_EQ(config, Config{});
}

// ============================================================================
// Errors
// ============================================================================

TEST(ErrorTest, ToStringIncludesStatus) {
    Error err(ErrorCode::SERVER_ERROR, "boom");
    err.with_status(503);
    EXPECT_EQ(err.to_string(), "SERVER_ERROR (HTTP 503): boom");
    EXPECT_FALSE(err.is_network());
    EXPECT_TRUE(Error(ErrorCode::TIMEOUT).is_network());
}

TEST(ErrorTest, ResultCarriesValueOrError) {
    Result<int> good = 7;
    Result<int> bad = Error(ErrorCode::NOT_FOUND, "missing");
    EXPECT_TRUE(good.ok());
    EXPECT_EQ(*good, 7);
    EXPECT_FALSE(bad.ok());
    EXPECT_EQ(bad.error_code(), ErrorCode::NOT_FOUND);
    EXPECT_EQ(bad.value_or(3), 3);
    EXPECT_THROW(bad.value(), std::runtime_error);
}

// ============================================================================
// Language detection
// ============================================================================

TEST(LanguageDetectorTest, ByExtension) {
    EXPECT_EQ(LanguageDetector::detect("", "main.cpp"), "cpp");
    EXPECT_EQ(LanguageDetector::detect("", "Script.PY"), "python");
    EXPECT_EQ(LanguageDetector::detect("", "Dockerfile"), "dockerfile");
    EXPECT_FALSE(LanguageDetector::detect("", "notes").has_value());
}

TEST(LanguageDetectorTest, ShebangWins) {
    EXPECT_EQ(LanguageDetector::detect("#!/usr/bin/env python3\nprint(1)\n", "tool"), "python");
    EXPECT_EQ(LanguageDetector::detect("#!/bin/sh\necho hi\n", "run.txt"), "bash");
}

TEST(LanguageDetectorTest, ContentType) {
    EXPECT_EQ(LanguageDetector::content_type("{}", "data.json"), "application/json");
    EXPECT_EQ(LanguageDetector::content_type("x", "a.rs"), "text/plain; charset=utf-8");
    EXPECT_EQ(LanguageDetector::content_type(std::string("a\0b", 3), "blob.bin"),
              "application/octet-stream");
}
