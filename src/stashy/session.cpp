#include <stashy/session.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace stashy {

Session::Session(ConfigStore& config_store,
                 CredentialVault& vault,
                 http::Transport& transport,
                 Logger* logger)
    : config_store_(config_store)
    , vault_(vault)
    , transport_(transport)
    , logger_(logger ? logger : null_logger()) {}

Result<std::string> Session::normalize_server_url(const std::string& url) {
    std::string trimmed = url;
    while (!trimmed.empty() && std::isspace(static_cast<unsigned char>(trimmed.back()))) {
        trimmed.pop_back();
    }
    size_t first = 0;
    while (first < trimmed.size() && std::isspace(static_cast<unsigned char>(trimmed[first]))) {
        ++first;
    }
    trimmed = trimmed.substr(first);

    size_t scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos) {
        return Error(ErrorCode::VALIDATION_ERROR,
            "Invalid URL '" + url + "', make sure it starts with 'http://' or 'https://'");
    }
    std::string scheme = trimmed.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (scheme != "http" && scheme != "https") {
        return Error(ErrorCode::VALIDATION_ERROR, "URL must use http or https scheme");
    }

    std::string rest = trimmed.substr(scheme_end + 3);
    size_t host_end = rest.find_first_of("/?#");
    std::string host = rest.substr(0, host_end);
    if (host.empty() || host.find_first_of(" \t@") != std::string::npos) {
        return Error(ErrorCode::VALIDATION_ERROR, "URL has no valid host: " + url);
    }
    if (host_end != std::string::npos && rest[host_end] != '/') {
        return Error(ErrorCode::VALIDATION_ERROR, "Server URL must not carry a query or fragment");
    }

    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }
    return scheme + "://" + rest;
}

std::unique_ptr<ApiClient> Session::make_client(const std::string& server_url) const {
    ApiClientConfig api_config;
    api_config.server_url = server_url;
    api_config.timeout_ms = static_cast<long>(config_.timeout_seconds) * 1000;
    return std::make_unique<ApiClient>(transport_, vault_, std::move(api_config), logger_);
}

Result<void> Session::restore() {
    auto loaded = config_store_.load();
    if (!loaded.ok()) {
        return loaded.error();
    }
    config_ = loaded.value();
    state_ = SessionState::UNAUTHENTICATED;
    api_.reset();

    if (config_.server_url.empty()) {
        logger_->debug("No server configured");
        return Ok();
    }

    auto token = vault_.retrieve(config_.server_url);
    if (!token.ok()) {
        if (token.error_code() == ErrorCode::NOT_FOUND) {
            logger_->debug("No stored key for " + config_.server_url);
            return Ok();
        }
        return token.error();
    }

    api_ = make_client(config_.server_url);
    state_ = SessionState::AUTHENTICATED;
    logger_->debug("Restored session for " + config_.server_url);
    return Ok();
}

Result<void> Session::login(const std::string& server_url, const std::string& secret) {
    auto url = normalize_server_url(server_url);
    if (!url.ok()) {
        return url.error();
    }
    if (secret.empty()) {
        return Error(ErrorCode::VALIDATION_ERROR, "API key must not be empty");
    }

    auto client = make_client(url.value());
    logger_->info("Validating API key against " + url.value());
    auto probe = client->probe(secret);
    if (!probe.ok()) {
        return probe.error();
    }

    // Re-login to the same server overwrites the entry; keep the old key for rollback
    std::optional<std::string> previous;
    auto existing = vault_.retrieve(url.value());
    if (existing.ok()) {
        previous = existing.value();
    } else if (existing.error_code() != ErrorCode::NOT_FOUND) {
        return existing.error();
    }

    auto stored = vault_.store(url.value(), secret);
    if (!stored.ok()) {
        return stored.error();
    }

    // Keep preferences from disk; a broken file is replaced rather than blocking login
    Config updated = config_;
    auto on_disk = config_store_.load();
    if (on_disk.ok()) {
        updated = on_disk.value();
    } else {
        logger_->warning("Replacing unreadable config: " + on_disk.error().to_string());
    }
    updated.server_url = url.value();
    auto saved = config_store_.save(updated);
    if (!saved.ok()) {
        auto rollback = previous ? vault_.store(url.value(), *previous)
                                 : vault_.remove(url.value());
        if (!rollback.ok()) {
            logger_->warning("Could not roll back stored key: " + rollback.error().to_string());
        }
        return saved.error();
    }

    config_ = updated;
    api_ = std::move(client);
    state_ = SessionState::AUTHENTICATED;
    logger_->info("Logged in to " + config_.server_url);
    return Ok();
}

Result<std::string> Session::exchange_password(const std::string& server_url,
                                               const std::string& username,
                                               const std::string& password,
                                               const std::string& key_name) {
    auto url = normalize_server_url(server_url);
    if (!url.ok()) {
        return url.error();
    }
    if (username.empty() || password.empty()) {
        return Error(ErrorCode::VALIDATION_ERROR, "Username and password are required");
    }
    return make_client(url.value())->exchange_password(username, password, key_name);
}

Result<void> Session::logout() {
    if (!config_.server_url.empty()) {
        auto removed = vault_.remove(config_.server_url);
        if (!removed.ok()) {
            return removed.error();
        }
        logger_->info("Logged out of " + config_.server_url);
    }
    api_.reset();
    state_ = SessionState::UNAUTHENTICATED;
    return Ok();
}

Result<void> Session::update_preferences(uint32_t default_page_size, int timeout_seconds) {
    if (default_page_size == 0) {
        return Error(ErrorCode::VALIDATION_ERROR, "Page size must be at least 1");
    }
    if (timeout_seconds <= 0 || timeout_seconds > MAX_TIMEOUT_SECONDS) {
        return Error(ErrorCode::VALIDATION_ERROR,
            "Timeout must be between 1 and " + std::to_string(MAX_TIMEOUT_SECONDS) + " seconds");
    }

    Config updated = config_;
    updated.default_page_size = default_page_size;
    updated.timeout_seconds = timeout_seconds;
    auto saved = config_store_.save(updated);
    if (!saved.ok()) {
        return saved.error();
    }
    config_ = updated;
    if (api_) {
        api_ = make_client(config_.server_url);
    }
    return Ok();
}

}  // namespace stashy
