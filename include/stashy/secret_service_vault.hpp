#pragma once

#include <stashy/credential_vault.hpp>
#include <stashy/util/logger.hpp>

namespace stashy {

/**
 * CredentialVault backed by the freedesktop Secret Service (libsecret),
 * i.e. GNOME Keyring or KWallet.
 *
 * Entries carry the attributes service=stashy and server=<server_url> and are
 * stored in the default collection.
 */
class SecretServiceVault : public CredentialVault {
public:
    explicit SecretServiceVault(Logger* logger = nullptr);

    Result<void> store(const std::string& server_url, const std::string& secret) override;
    Result<std::string> retrieve(const std::string& server_url) override;
    Result<void> remove(const std::string& server_url) override;
    bool is_available() const override;

private:
    Logger* logger_;
};

}  // namespace stashy
