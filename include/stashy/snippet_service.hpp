#pragma once

#include <stashy/result.hpp>
#include <stashy/session.hpp>
#include <stashy/types.hpp>
#include <stashy/util/logger.hpp>

#include <optional>
#include <vector>

namespace stashy {

class SnippetService;

/**
 * Lazy, finite walk over the listing, one request per next() call.
 *
 * Pages are requested strictly in order 1, 2, 3, ... The walk ends once the
 * items seen reach the total reported by the server, or when a page comes
 * back empty. reset() starts over at page 1. A caller may stop at any time.
 */
class PageCursor {
public:
    /**
     * Fetch the next page.
     * @return The page, nullopt once exhausted, or the request error
     *         (the cursor stays on the failed page)
     */
    Result<std::optional<Page>> next();

    void reset();

    bool done() const { return done_; }

    // Last page fetched successfully, 0 before the first
    uint32_t last_page() const { return next_page_ - 1; }

    uint64_t items_seen() const { return items_seen_; }

    uint32_t page_size() const { return page_size_; }

private:
    friend class SnippetService;
    PageCursor(Session& session, uint32_t page_size);

    Session* session_;
    uint32_t page_size_;
    uint32_t next_page_ = 1;
    uint64_t items_seen_ = 0;
    bool done_ = false;
};

/**
 * SnippetService - snippet operations on top of an authenticated Session.
 *
 * Every call first checks the session; while UNAUTHENTICATED it fails with
 * AUTH_REQUIRED without touching the network.
 */
class SnippetService {
public:
    explicit SnippetService(Session& session, Logger* logger = nullptr);

    // ========================================================================
    // CRUD Operations
    // ========================================================================

    /**
     * Upload a new snippet.
     *
     * @param draft Validated input; files are sent in order
     * @return The snippet as stored by the server, with its assigned id
     */
    Result<Snippet> create(const SnippetDraft& draft);

    /**
     * Fetch one snippet including file contents.
     * @return NOT_FOUND if the id does not exist
     */
    Result<Snippet> get(SnippetId id);

    /**
     * Replace a snippet. This is a full replace, not a patch: the server
     * discards every existing file and keeps exactly draft.files. Fields are
     * never merged with the previous version; callers wanting to keep a value
     * must send it again.
     */
    Result<Snippet> update(SnippetId id, const SnippetDraft& draft);

    /**
     * Delete a snippet. No confirmation happens here; `force` only records
     * that the caller skipped its own prompt.
     * @return NOT_FOUND if the id does not exist
     */
    Result<void> remove(SnippetId id, bool force);

    // ========================================================================
    // Listing
    // ========================================================================

    // One page with its metadata
    Result<Page> list_page(uint32_t page, uint32_t page_size);

    /**
     * List snippet summaries.
     *
     * all == false: the items of the requested page.
     * all == true: pages 1..n fetched in order and concatenated as returned
     * (no reordering, no deduplication). On a failure part way through,
     * nothing is returned; the error carries last_page() = the last page
     * fetched successfully, and the listing must be restarted.
     */
    Result<std::vector<Snippet>> list(uint32_t page, uint32_t page_size, bool all);

    // Page walk for callers that want to stop early or keep partial results
    PageCursor pages(uint32_t page_size);

    // ========================================================================
    // Search
    // ========================================================================

    /**
     * Search titles and descriptions, plus file contents when
     * query.search_code is set. Results are ordered by query.sort.
     */
    Result<std::vector<Snippet>> search(const SearchQuery& query);

    /**
     * Order search results in place.
     * newest/oldest: updated_at descending/ascending, ties by id ascending.
     * alpha-asc: case-insensitive title, ties by id ascending.
     * alpha-desc: exactly the reverse of alpha-asc.
     */
    static void sort_results(std::vector<Snippet>& snippets, SortOrder order);

private:
    Session& session_;
    Logger* logger_;

    Result<ApiClient*> client();
};

}  // namespace stashy
