#include <stashy/secret_service_vault.hpp>

#include <libsecret/secret.h>

namespace stashy {

namespace {

const SecretSchema* token_schema() {
    static const SecretSchema schema = {
        "io.stashy.ApiToken", SECRET_SCHEMA_NONE,
        {
            {"service", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {"server", SECRET_SCHEMA_ATTRIBUTE_STRING},
            {nullptr, SECRET_SCHEMA_ATTRIBUTE_STRING},
        }
    };
    return &schema;
}

// Takes ownership of a GError and turns it into a CREDENTIAL_ERROR
Error take_error(GError* error, const std::string& action) {
    std::string detail = error && error->message ? error->message : "unknown error";
    if (error) {
        g_error_free(error);
    }
    return Error(ErrorCode::CREDENTIAL_ERROR, action + ": " + detail);
}

}  // namespace

SecretServiceVault::SecretServiceVault(Logger* logger)
    : logger_(logger ? logger : null_logger()) {}

Result<void> SecretServiceVault::store(const std::string& server_url, const std::string& secret) {
    GError* error = nullptr;
    std::string label = std::string("stashy API token for ") + server_url;

    gboolean stored = secret_password_store_sync(
        token_schema(), SECRET_COLLECTION_DEFAULT, label.c_str(), secret.c_str(),
        nullptr, &error,
        "service", CREDENTIAL_SERVICE,
        "server", server_url.c_str(),
        nullptr);

    if (!stored || error) {
        return take_error(error, "Failed to store credential for " + server_url);
    }
    logger_->debug("Stored credential for " + server_url);
    return Ok();
}

Result<std::string> SecretServiceVault::retrieve(const std::string& server_url) {
    GError* error = nullptr;
    gchar* password = secret_password_lookup_sync(
        token_schema(), nullptr, &error,
        "service", CREDENTIAL_SERVICE,
        "server", server_url.c_str(),
        nullptr);

    if (error) {
        if (password) {
            secret_password_free(password);
        }
        return take_error(error, "Failed to read credential for " + server_url);
    }
    if (!password) {
        return Error(ErrorCode::NOT_FOUND, "No credential stored for " + server_url);
    }

    std::string secret(password);
    secret_password_free(password);
    return secret;
}

Result<void> SecretServiceVault::remove(const std::string& server_url) {
    GError* error = nullptr;
    gboolean removed = secret_password_clear_sync(
        token_schema(), nullptr, &error,
        "service", CREDENTIAL_SERVICE,
        "server", server_url.c_str(),
        nullptr);

    if (error) {
        return take_error(error, "Failed to delete credential for " + server_url);
    }
    logger_->debug(removed ? "Deleted credential for " + server_url
                           : "No credential to delete for " + server_url);
    return Ok();
}

bool SecretServiceVault::is_available() const {
    GError* error = nullptr;
    SecretService* service = secret_service_get_sync(SECRET_SERVICE_NONE, nullptr, &error);
    if (error) {
        logger_->debug(std::string("Secret Service unavailable: ") + error->message);
        g_error_free(error);
    }
    if (!service) {
        return false;
    }
    g_object_unref(service);
    return true;
}

}  // namespace stashy
