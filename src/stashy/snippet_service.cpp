#include <stashy/snippet_service.hpp>
#include <stashy/snippet_draft.hpp>

#include <algorithm>
#include <cctype>

namespace stashy {

namespace {

// Case-insensitive (ASCII) title comparison, ties by id
bool title_less(const Snippet& a, const Snippet& b) {
    auto ai = a.title.begin(), bi = b.title.begin();
    for (; ai != a.title.end() && bi != b.title.end(); ++ai, ++bi) {
        int ca = std::tolower(static_cast<unsigned char>(*ai));
        int cb = std::tolower(static_cast<unsigned char>(*bi));
        if (ca != cb) return ca < cb;
    }
    if (a.title.size() != b.title.size()) {
        return a.title.size() < b.title.size();
    }
    return a.id < b.id;
}

Error auth_required() {
    return Error(ErrorCode::AUTH_REQUIRED, "Not logged in. Run 'stashy login <server-url>'");
}

}  // namespace

// ============================================================================
// PageCursor
// ============================================================================

PageCursor::PageCursor(Session& session, uint32_t page_size)
    : session_(&session), page_size_(page_size == 0 ? DEFAULT_PAGE_SIZE : page_size) {}

void PageCursor::reset() {
    next_page_ = 1;
    items_seen_ = 0;
    done_ = false;
}

Result<std::optional<Page>> PageCursor::next() {
    if (done_) {
        return std::optional<Page>();
    }

    ApiClient* api = session_->api();
    if (!session_->is_authenticated() || !api) {
        return auth_required();
    }

    auto page = api->list_snippets(next_page_, page_size_);
    if (!page.ok()) {
        return page.error();
    }

    ++next_page_;
    if (page->items.empty()) {
        done_ = true;
        return std::optional<Page>();
    }

    items_seen_ += page->items.size();
    if (items_seen_ >= page->total) {
        done_ = true;
    }
    return std::optional<Page>(std::move(page.value()));
}

// ============================================================================
// SnippetService
// ============================================================================

SnippetService::SnippetService(Session& session, Logger* logger)
    : session_(session)
    , logger_(logger ? logger : null_logger()) {}

Result<ApiClient*> SnippetService::client() {
    ApiClient* api = session_.api();
    if (!session_.is_authenticated() || !api) {
        return auth_required();
    }
    return api;
}

Result<Snippet> SnippetService::create(const SnippetDraft& draft) {
    auto api = client();
    if (!api.ok()) {
        return api.error();
    }
    auto valid = validate_draft(draft);
    if (!valid.ok()) {
        return valid.error();
    }

    auto created = api.value()->create_snippet(draft);
    if (created.ok()) {
        logger_->debug("Created snippet " + std::to_string(created->id) + " with " +
                       std::to_string(draft.files.size()) + " file(s)");
    }
    return created;
}

Result<Snippet> SnippetService::get(SnippetId id) {
    auto api = client();
    if (!api.ok()) {
        return api.error();
    }
    return api.value()->get_snippet(id);
}

Result<Snippet> SnippetService::update(SnippetId id, const SnippetDraft& draft) {
    auto api = client();
    if (!api.ok()) {
        return api.error();
    }
    auto valid = validate_draft(draft);
    if (!valid.ok()) {
        return valid.error();
    }

    auto updated = api.value()->update_snippet(id, draft);
    if (updated.ok() && updated->id != id) {
        return Error(ErrorCode::INVALID_RESPONSE,
            "Server answered update of snippet " + std::to_string(id) +
            " with snippet " + std::to_string(updated->id));
    }
    return updated;
}

Result<void> SnippetService::remove(SnippetId id, bool force) {
    auto api = client();
    if (!api.ok()) {
        return api.error();
    }
    logger_->debug("Deleting snippet " + std::to_string(id) + (force ? " (forced)" : ""));
    return api.value()->delete_snippet(id);
}

Result<Page> SnippetService::list_page(uint32_t page, uint32_t page_size) {
    auto api = client();
    if (!api.ok()) {
        return api.error();
    }
    return api.value()->list_snippets(page, page_size);
}

PageCursor SnippetService::pages(uint32_t page_size) {
    return PageCursor(session_, page_size);
}

Result<std::vector<Snippet>> SnippetService::list(uint32_t page, uint32_t page_size, bool all) {
    if (!all) {
        auto one = list_page(page, page_size);
        if (!one.ok()) {
            return one.error();
        }
        return std::move(one->items);
    }

    auto api = client();
    if (!api.ok()) {
        return api.error();
    }

    std::vector<Snippet> items;
    PageCursor cursor = pages(page_size);
    while (!cursor.done()) {
        auto next = cursor.next();
        if (!next.ok()) {
            Error err = next.error();
            uint32_t last = cursor.last_page();
            Error wrapped(err.code(), err.message() + " (listing stopped after page " +
                                      std::to_string(last) + ")");
            if (err.http_status()) wrapped.with_status(*err.http_status());
            if (!err.body().empty()) wrapped.with_body(err.body());
            if (err.retry_after()) wrapped.with_retry_after(*err.retry_after());
            wrapped.with_last_page(last);
            return wrapped;
        }
        if (!next->has_value()) {
            break;
        }
        auto& fetched = next->value().items;
        items.insert(items.end(),
                     std::make_move_iterator(fetched.begin()),
                     std::make_move_iterator(fetched.end()));
    }

    logger_->debug("Listed " + std::to_string(items.size()) + " snippet(s) over " +
                   std::to_string(cursor.last_page()) + " page(s)");
    return items;
}

Result<std::vector<Snippet>> SnippetService::search(const SearchQuery& query) {
    auto api = client();
    if (!api.ok()) {
        return api.error();
    }
    if (query.text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error(ErrorCode::VALIDATION_ERROR, "Search query must not be empty");
    }

    auto results = api.value()->search_snippets(query);
    if (!results.ok()) {
        return results.error();
    }
    sort_results(results.value(), query.sort);
    return results;
}

void SnippetService::sort_results(std::vector<Snippet>& snippets, SortOrder order) {
    switch (order) {
        case SortOrder::NEWEST:
            std::sort(snippets.begin(), snippets.end(), [](const Snippet& a, const Snippet& b) {
                if (a.updated_at != b.updated_at) return a.updated_at > b.updated_at;
                return a.id < b.id;
            });
            break;
        case SortOrder::OLDEST:
            std::sort(snippets.begin(), snippets.end(), [](const Snippet& a, const Snippet& b) {
                if (a.updated_at != b.updated_at) return a.updated_at < b.updated_at;
                return a.id < b.id;
            });
            break;
        case SortOrder::ALPHA_ASC:
            std::sort(snippets.begin(), snippets.end(), title_less);
            break;
        case SortOrder::ALPHA_DESC:
            std::sort(snippets.begin(), snippets.end(), title_less);
            std::reverse(snippets.begin(), snippets.end());
            break;
    }
}

}  // namespace stashy
