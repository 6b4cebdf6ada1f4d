#include <stashy/api_client.hpp>
#include <stashy/json_codec.hpp>
#include <stashy/language_detector.hpp>
#include <stashy/snippet_draft.hpp>

#include <nlohmann/json.hpp>

namespace stashy {

using json = nlohmann::json;

namespace {

std::string snippet_path(SnippetId id) {
    return "/snippets/" + std::to_string(id);
}

}  // namespace

ApiClient::ApiClient(http::Transport& transport,
                     CredentialVault& vault,
                     ApiClientConfig config,
                     Logger* logger)
    : transport_(transport)
    , vault_(vault)
    , config_(std::move(config))
    , logger_(logger ? logger : null_logger()) {
    while (!config_.server_url.empty() && config_.server_url.back() == '/') {
        config_.server_url.pop_back();
    }
}

Error ApiClient::classify(const http::Response& response) {
    long status = response.status;
    std::string detail = error_detail(response.body);

    if (status == 401) {
        return Error(ErrorCode::UNAUTHORIZED,
                     detail.empty() ? "API key rejected by the server" : detail)
            .with_status(status);
    }
    if (status == 404) {
        return Error(ErrorCode::NOT_FOUND, detail.empty() ? "Not found" : detail)
            .with_status(status);
    }
    if (status == 429) {
        Error err(ErrorCode::RATE_LIMITED, detail.empty() ? "Rate limit exceeded" : detail);
        err.with_status(status);
        if (const std::string* hint = response.header("Retry-After")) {
            err.with_retry_after(*hint);
        }
        return err;
    }
    if (status >= 500) {
        return Error(ErrorCode::SERVER_ERROR, detail.empty() ? "Server error" : detail)
            .with_status(status)
            .with_body(response.body);
    }
    return Error(ErrorCode::API_ERROR,
                 detail.empty() ? "Unexpected HTTP status" : detail)
        .with_status(status)
        .with_body(response.body);
}

http::MultipartBody ApiClient::encode_draft(const SnippetDraft& draft) {
    http::MultipartBody body;
    body.add_field("title", draft.title);
    body.add_field("description", draft.description);
    body.add_field("visibility", visibility_name(draft.visibility));
    for (const auto& category : draft.categories) {
        body.add_field("categories[]", category);
    }
    for (const auto& file : draft.files) {
        body.add_file("files[]", file.filename,
                      LanguageDetector::content_type(file.content, file.filename),
                      file.content);
    }
    return body;
}

Result<std::string> ApiClient::bearer_token() {
    auto token = vault_.retrieve(config_.server_url);
    if (!token.ok()) {
        if (token.error_code() == ErrorCode::NOT_FOUND) {
            return Error(ErrorCode::AUTH_REQUIRED,
                "No API key stored for " + config_.server_url);
        }
        return token.error();
    }
    return token;
}

Result<http::Response> ApiClient::send(http::Method method,
                                       const std::string& path,
                                       const std::string* token,
                                       std::string body,
                                       const std::string& content_type) {
    http::Request request;
    request.method = method;
    request.url = config_.server_url + path;
    request.timeout_ms = config_.timeout_ms;
    request.headers.emplace_back("Accept", "application/json");
    if (token) {
        request.headers.emplace_back("Authorization", "Bearer " + *token);
    }
    if (!content_type.empty()) {
        request.headers.emplace_back("Content-Type", content_type);
    }
    request.body = std::move(body);

    logger_->debug(std::string(http::method_name(method)) + " " + path +
                   (request.body.empty() ? "" : " (" + std::to_string(request.body.size()) + " bytes)"));

    auto response = transport_.perform(request);
    if (!response.ok()) {
        logger_->debug(std::string(http::method_name(method)) + " " + path + " failed: " +
                       response.error().to_string());
        return response.error();
    }

    logger_->debug(std::string(http::method_name(method)) + " " + path + " -> HTTP " +
                   std::to_string(response->status) + " (" +
                   std::to_string(response->body.size()) + " bytes)");

    if (!response->is_success()) {
        return classify(response.value());
    }
    return response;
}

Result<http::Response> ApiClient::send_authenticated(http::Method method,
                                                     const std::string& path,
                                                     std::string body,
                                                     const std::string& content_type) {
    auto token = bearer_token();
    if (!token.ok()) {
        return token.error();
    }
    return send(method, path, &token.value(), std::move(body), content_type);
}

Result<Page> ApiClient::fetch_page(const std::string& token, uint32_t page, uint32_t page_size) {
    std::string path = "/snippets?page=" + std::to_string(page) +
                       "&page_size=" + std::to_string(page_size);
    auto response = send(http::Method::GET, path, &token);
    if (!response.ok()) {
        return response.error();
    }
    return parse_page(response->body, page, page_size);
}

Result<Page> ApiClient::probe(const std::string& token) {
    return fetch_page(token, 1, 1);
}

Result<Page> ApiClient::list_snippets(uint32_t page, uint32_t page_size) {
    if (page == 0 || page_size == 0) {
        return Error(ErrorCode::VALIDATION_ERROR, "Page and page size start at 1");
    }
    auto token = bearer_token();
    if (!token.ok()) {
        return token.error();
    }
    return fetch_page(token.value(), page, page_size);
}

Result<Snippet> ApiClient::create_snippet(const SnippetDraft& draft) {
    auto valid = validate_draft(draft);
    if (!valid.ok()) {
        return valid.error();
    }

    auto body = encode_draft(draft);
    auto response = send_authenticated(http::Method::POST, "/snippets",
                                       body.encode(), body.content_type());
    if (!response.ok()) {
        return response.error();
    }
    return parse_snippet(response->body);
}

Result<Snippet> ApiClient::get_snippet(SnippetId id) {
    auto response = send_authenticated(http::Method::GET, snippet_path(id));
    if (!response.ok()) {
        return response.error();
    }
    return parse_snippet(response->body);
}

Result<Snippet> ApiClient::update_snippet(SnippetId id, const SnippetDraft& draft) {
    auto valid = validate_draft(draft);
    if (!valid.ok()) {
        return valid.error();
    }

    auto body = encode_draft(draft);
    auto response = send_authenticated(http::Method::PUT, snippet_path(id),
                                       body.encode(), body.content_type());
    if (!response.ok()) {
        return response.error();
    }
    return parse_snippet(response->body);
}

Result<void> ApiClient::delete_snippet(SnippetId id) {
    auto response = send_authenticated(http::Method::DELETE, snippet_path(id));
    if (!response.ok()) {
        return response.error();
    }
    return Ok();
}

Result<std::vector<Snippet>> ApiClient::search_snippets(const SearchQuery& query) {
    std::string path = "/snippets/search?q=" + http::url_encode(query.text) +
                       "&sort=" + sort_order_name(query.sort) +
                       "&search_code=" + (query.search_code ? "true" : "false");
    auto response = send_authenticated(http::Method::GET, path);
    if (!response.ok()) {
        return response.error();
    }
    return parse_snippet_list(response->body);
}

Result<std::string> ApiClient::exchange_password(const std::string& username,
                                                 const std::string& password,
                                                 const std::string& key_name) {
    json login_body = {{"username", username}, {"password", password}};
    auto login = send(http::Method::POST, "/auth/login", nullptr,
                      login_body.dump(), "application/json");
    if (!login.ok()) {
        if (login.error_code() == ErrorCode::UNAUTHORIZED) {
            return Error(ErrorCode::UNAUTHORIZED, "Invalid username or password")
                .with_status(401);
        }
        return login.error();
    }

    std::string session_token;
    try {
        session_token = json::parse(login->body).at("token").get<std::string>();
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_RESPONSE,
            std::string("Login response has no token: ") + e.what());
    }

    json key_body = {{"name", key_name}};
    auto key = send(http::Method::POST, "/keys", &session_token,
                    key_body.dump(), "application/json");
    if (!key.ok()) {
        return key.error();
    }

    try {
        return json::parse(key->body).at("key").get<std::string>();
    } catch (const json::exception& e) {
        return Error(ErrorCode::INVALID_RESPONSE,
            std::string("API key response has no key: ") + e.what());
    }
}

}  // namespace stashy
