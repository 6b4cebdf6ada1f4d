#pragma once

#include <stashy/result.hpp>

#include <memory>
#include <string>

namespace stashy {

// Service identifier every vault entry is filed under
constexpr const char* CREDENTIAL_SERVICE = "stashy";

/**
 * Abstract secure storage for API tokens, one entry per server URL.
 *
 * Implementations must never log or echo the secret value.
 */
class CredentialVault {
public:
    virtual ~CredentialVault() = default;

    /**
     * Store (or overwrite) the token for a server.
     * @return CREDENTIAL_ERROR if the platform store rejects it
     */
    virtual Result<void> store(const std::string& server_url, const std::string& secret) = 0;

    /**
     * Retrieve the token for a server.
     * @return NOT_FOUND when no entry exists, CREDENTIAL_ERROR on failure
     */
    virtual Result<std::string> retrieve(const std::string& server_url) = 0;

    /**
     * Delete the token for a server. Deleting a missing entry succeeds.
     */
    virtual Result<void> remove(const std::string& server_url) = 0;

    // Whether the backing store can be reached at all
    virtual bool is_available() const = 0;
};

using VaultPtr = std::unique_ptr<CredentialVault>;

}  // namespace stashy
