#include <gtest/gtest.h>
#include <stashy/json_codec.hpp>

using namespace stashy;

// ============================================================================
// Snippets
// ============================================================================

TEST(JsonCodecTest, ParsesFullSnippet) {
    auto result = parse_snippet(R"({
        "id": 42,
        "title": "Retry loop",
        "description": "Backoff helper",
        "visibility": "public",
        "categories": ["go", "net", "go"],
        "files": [
            {"filename": "retry.go", "content": "package retry", "language": "go"},
            {"filename": "README.md", "content": "# retry"}
        ],
        "created_at": "2024-05-01T10:00:00Z",
        "updated_at": "2024-05-02T11:15:00Z",
        "share_count": 3
    })");
    ASSERT_TRUE(result.ok()) << result.error().to_string();

    const Snippet& s = result.value();
    EXPECT_EQ(s.id, 42u);
    EXPECT_EQ(s.title, "Retry loop");
    EXPECT_EQ(s.visibility, Visibility::PUBLIC);
    EXPECT_EQ(s.categories, (std::set<std::string>{"go", "net"}));
    ASSERT_EQ(s.files.size(), 2u);
    EXPECT_EQ(s.files[0].filename, "retry.go");
    EXPECT_EQ(s.files[0].language, std::optional<std::string>("go"));
    EXPECT_FALSE(s.files[1].language.has_value());
    EXPECT_EQ(format_timestamp(s.updated_at), "2024-05-02 11:15");
    EXPECT_EQ(s.share_count, 3u);
}

TEST(JsonCodecTest, AcceptsLegacyFieldNames) {
    auto result = parse_snippet(R"({"snippet": {
        "id": 7,
        "title": "t",
        "is_public": true,
        "fragments": [
            {"file_name": "b.py", "code": "b", "position": 1},
            {"file_name": "a.py", "code": "a", "position": 0}
        ]
    }})");
    ASSERT_TRUE(result.ok()) << result.error().to_string();

    EXPECT_EQ(result->id, 7u);
    EXPECT_EQ(result->visibility, Visibility::PUBLIC);
    ASSERT_EQ(result->files.size(), 2u);
    EXPECT_EQ(result->files[0].filename, "a.py");
    EXPECT_EQ(result->files[0].content, "a");
    EXPECT_EQ(result->files[1].filename, "b.py");
}

TEST(JsonCodecTest, MissingIdIsInvalidResponse) {
    auto result = parse_snippet(R"({"title": "no id"})");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::INVALID_RESPONSE);
}

TEST(JsonCodecTest, MalformedBodyIsInvalidResponse) {
    EXPECT_EQ(parse_snippet("<html>").error_code(), ErrorCode::INVALID_RESPONSE);
    EXPECT_EQ(parse_snippet_list("{}").error_code(), ErrorCode::INVALID_RESPONSE);
}

// ============================================================================
// Pages
// ============================================================================

TEST(JsonCodecTest, ParsesPageMetadata) {
    auto page = parse_page(R"({"items": [{"id": 1}, {"id": 2}], "page": 3,
                               "page_size": 2, "total": 9})", 3, 2);
    ASSERT_TRUE(page.ok()) << page.error().to_string();
    EXPECT_EQ(page->items.size(), 2u);
    EXPECT_EQ(page->page_number, 3u);
    EXPECT_EQ(page->page_size, 2u);
    EXPECT_EQ(page->total, 9u);
}

TEST(JsonCodecTest, BareArrayPageFallsBackToRequest) {
    auto page = parse_page(R"([{"id": 5}])", 1, 20);
    ASSERT_TRUE(page.ok());
    EXPECT_EQ(page->page_number, 1u);
    EXPECT_EQ(page->page_size, 20u);
    EXPECT_EQ(page->total, 1u);
}

TEST(JsonCodecTest, ItemWithoutIdFailsWholePage) {
    auto page = parse_page(R"({"items": [{"id": 1}, {"title": "x"}]})", 1, 20);
    ASSERT_FALSE(page.ok());
    EXPECT_EQ(page.error_code(), ErrorCode::INVALID_RESPONSE);
}

// ============================================================================
// Error bodies
// ============================================================================

TEST(JsonCodecTest, ErrorDetail) {
    EXPECT_EQ(error_detail(R"({"error": "Snippet not found"})"), "Snippet not found");
    EXPECT_EQ(error_detail(R"({"message": "slow down"})"), "slow down");
    EXPECT_EQ(error_detail("plain text"), "plain text");
    EXPECT_EQ(error_detail(""), "");

    std::string long_body(500, 'x');
    EXPECT_EQ(error_detail(long_body).size(), 203u);
}
