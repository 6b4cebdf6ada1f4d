#pragma once

#include <stashy/credential_vault.hpp>
#include <stashy/http/multipart.hpp>
#include <stashy/http/transport.hpp>
#include <stashy/result.hpp>
#include <stashy/types.hpp>
#include <stashy/util/logger.hpp>

#include <string>
#include <vector>

namespace stashy {

/**
 * Configuration for the snippet API client.
 */
struct ApiClientConfig {
    std::string server_url;             // Base URL, no trailing slash
    long timeout_ms = DEFAULT_TIMEOUT_SECONDS * 1000L;
};

/**
 * HTTP client for the snippet service.
 *
 * Every authenticated request carries "Authorization: Bearer <token>" with the
 * token read from the vault entry for config.server_url. Responses are
 * classified into ErrorCodes; nothing is retried.
 *
 * Thread safety: NOT thread-safe (the transport is shared).
 */
class ApiClient {
public:
    ApiClient(http::Transport& transport,
              CredentialVault& vault,
              ApiClientConfig config,
              Logger* logger = nullptr);

    /**
     * Lightweight request used to validate a token before it is stored:
     * fetches page 1 with a page size of 1.
     */
    Result<Page> probe(const std::string& token);

    // POST /snippets (multipart)
    Result<Snippet> create_snippet(const SnippetDraft& draft);

    // GET /snippets?page=&page_size=
    Result<Page> list_snippets(uint32_t page, uint32_t page_size);

    // GET /snippets/{id}
    Result<Snippet> get_snippet(SnippetId id);

    /**
     * PUT /snippets/{id} (multipart). The server replaces the whole file set
     * with draft.files; nothing of the previous files is kept.
     */
    Result<Snippet> update_snippet(SnippetId id, const SnippetDraft& draft);

    // DELETE /snippets/{id}
    Result<void> delete_snippet(SnippetId id);

    // GET /snippets/search?q=&sort=&search_code=
    Result<std::vector<Snippet>> search_snippets(const SearchQuery& query);

    /**
     * Sign in with a username and password and mint a named API key.
     * POST /auth/login, then POST /keys with the session token.
     *
     * @return The new API key
     */
    Result<std::string> exchange_password(const std::string& username,
                                          const std::string& password,
                                          const std::string& key_name);

    /**
     * Map a non-2xx response to an Error:
     * 401 UNAUTHORIZED, 404 NOT_FOUND, 429 RATE_LIMITED (+Retry-After),
     * 5xx SERVER_ERROR (+status, body), anything else API_ERROR.
     */
    static Error classify(const http::Response& response);

    /**
     * Multipart body for create/update: title, description, visibility,
     * one "categories[]" part per category, then one "files[]" part per file
     * in the order given.
     */
    static http::MultipartBody encode_draft(const SnippetDraft& draft);

    const ApiClientConfig& config() const { return config_; }

private:
    http::Transport& transport_;
    CredentialVault& vault_;
    ApiClientConfig config_;
    Logger* logger_;

    Result<std::string> bearer_token();

    Result<http::Response> send(http::Method method,
                                const std::string& path,
                                const std::string* token,
                                std::string body = "",
                                const std::string& content_type = "");

    Result<http::Response> send_authenticated(http::Method method,
                                              const std::string& path,
                                              std::string body = "",
                                              const std::string& content_type = "");

    Result<Page> fetch_page(const std::string& token, uint32_t page, uint32_t page_size);
};

}  // namespace stashy
