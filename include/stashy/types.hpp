#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stashy {

// Server-assigned snippet identifier
using SnippetId = uint64_t;
constexpr SnippetId INVALID_SNIPPET_ID = 0;

using Timestamp = std::chrono::system_clock::time_point;

constexpr uint32_t DEFAULT_PAGE_SIZE = 20;
constexpr int DEFAULT_TIMEOUT_SECONDS = 30;
constexpr int MAX_TIMEOUT_SECONDS = 3600;

enum class Visibility { PUBLIC, PRIVATE };

const char* visibility_name(Visibility v);
std::optional<Visibility> parse_visibility(const std::string& s);

/**
 * Non-secret client configuration, persisted by ConfigStore.
 */
struct Config {
    std::string server_url;
    uint32_t default_page_size = DEFAULT_PAGE_SIZE;
    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;

    bool operator==(const Config& other) const {
        return server_url == other.server_url &&
               default_page_size == other.default_page_size &&
               timeout_seconds == other.timeout_seconds;
    }
    bool operator!=(const Config& other) const { return !(*this == other); }
};

/**
 * One file of a snippet. Order within a snippet is significant.
 */
struct SnippetFile {
    std::string filename;
    std::string content;
    std::optional<std::string> language;

    bool operator==(const SnippetFile& other) const {
        return filename == other.filename && content == other.content &&
               language == other.language;
    }
};

struct Snippet {
    SnippetId id = INVALID_SNIPPET_ID;
    std::string title;
    std::string description;
    Visibility visibility = Visibility::PRIVATE;
    std::set<std::string> categories;
    std::vector<SnippetFile> files;
    Timestamp created_at;
    Timestamp updated_at;
    uint64_t share_count = 0;
};

/**
 * One page of a listing. Items are snippet summaries; file bodies may be
 * absent depending on the server.
 */
struct Page {
    std::vector<Snippet> items;
    uint32_t page_number = 1;
    uint32_t page_size = DEFAULT_PAGE_SIZE;
    uint64_t total = 0;
};

enum class SortOrder { NEWEST, OLDEST, ALPHA_ASC, ALPHA_DESC };

const char* sort_order_name(SortOrder order);
std::optional<SortOrder> parse_sort_order(const std::string& s);

struct SearchQuery {
    std::string text;
    SortOrder sort = SortOrder::NEWEST;
    bool search_code = false;
};

/**
 * Validated input for create and update. Built by the command layer from
 * interactive prompts, checked by validate() before anything is sent.
 */
struct SnippetDraft {
    std::string title;
    std::string description;
    Visibility visibility = Visibility::PRIVATE;
    std::set<std::string> categories;
    std::vector<SnippetFile> files;
};

// ISO-8601 helpers ("2024-05-01T12:00:00Z", fractional seconds and offsets accepted)
std::optional<Timestamp> parse_timestamp(const std::string& text);
std::string format_timestamp(const Timestamp& ts);

}  // namespace stashy
