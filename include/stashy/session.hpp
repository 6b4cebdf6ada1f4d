#pragma once

#include <stashy/api_client.hpp>
#include <stashy/config_store.hpp>
#include <stashy/credential_vault.hpp>
#include <stashy/http/transport.hpp>
#include <stashy/result.hpp>
#include <stashy/types.hpp>
#include <stashy/util/logger.hpp>

#include <memory>
#include <string>

namespace stashy {

enum class SessionState { UNAUTHENTICATED, AUTHENTICATED };

/**
 * Session - login state machine over the config file and the vault.
 *
 *   UNAUTHENTICATED --login (probe ok)--> AUTHENTICATED
 *   AUTHENTICATED   --logout-----------> UNAUTHENTICATED
 *
 * The ApiClient only exists while AUTHENTICATED. All collaborators are
 * borrowed and must outlive the session.
 */
class Session {
public:
    Session(ConfigStore& config_store,
            CredentialVault& vault,
            http::Transport& transport,
            Logger* logger = nullptr);

    /**
     * Pick up a previous login: load the config and, if a server is set and
     * the vault holds its key, become AUTHENTICATED. Makes no network call.
     * A missing key is not an error.
     */
    Result<void> restore();

    /**
     * Validate the key with one probe request, then persist the server URL
     * and the key. Nothing is written unless the probe succeeds.
     */
    Result<void> login(const std::string& server_url, const std::string& secret);

    /**
     * Mint an API key from a username/password for a server. Does not log in;
     * pass the key to login() afterwards.
     */
    Result<std::string> exchange_password(const std::string& server_url,
                                          const std::string& username,
                                          const std::string& password,
                                          const std::string& key_name);

    // Delete the stored key and drop to UNAUTHENTICATED
    Result<void> logout();

    /**
     * Persist page size and timeout. The server URL is owned by login and
     * is kept as is.
     *
     * @return VALIDATION_ERROR for a zero page size or a timeout outside
     *         1..MAX_TIMEOUT_SECONDS
     */
    Result<void> update_preferences(uint32_t default_page_size, int timeout_seconds);

    SessionState state() const { return state_; }
    bool is_authenticated() const { return state_ == SessionState::AUTHENTICATED; }

    const Config& config() const { return config_; }

    // Client bound to the logged-in server, nullptr when UNAUTHENTICATED
    ApiClient* api() { return api_.get(); }

    /**
     * Normalize a server URL: scheme must be http or https, a host is
     * required, trailing slashes are removed.
     */
    static Result<std::string> normalize_server_url(const std::string& url);

private:
    ConfigStore& config_store_;
    CredentialVault& vault_;
    http::Transport& transport_;
    Logger* logger_;

    Config config_;
    SessionState state_ = SessionState::UNAUTHENTICATED;
    std::unique_ptr<ApiClient> api_;

    std::unique_ptr<ApiClient> make_client(const std::string& server_url) const;
};

}  // namespace stashy
