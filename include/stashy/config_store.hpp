#pragma once

#include <stashy/result.hpp>
#include <stashy/types.hpp>

#include <filesystem>

namespace stashy {

namespace fs = std::filesystem;

/**
 * ConfigStore - reads and writes the non-secret client configuration.
 *
 * The file is JSON: {"server_url": ..., "default_page_size": ..., "timeout_seconds": ...}.
 * Credentials are never written here; see CredentialVault.
 *
 * Concurrent writers are not coordinated; the last save wins.
 */
class ConfigStore {
public:
    explicit ConfigStore(fs::path path);

    /**
     * Store at the per-user default location:
     * $STASHY_CONFIG_DIR, else $XDG_CONFIG_HOME/stashy, else $HOME/.config/stashy.
     */
    static ConfigStore at_default_location();

    static fs::path default_directory();

    /**
     * Load the config. A missing file yields defaults.
     * @return CONFIG_ERROR on read or parse failure
     */
    Result<Config> load() const;

    /**
     * Write the config, creating the directory if needed.
     * The file is replaced atomically and restricted to the owner.
     */
    Result<void> save(const Config& config) const;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

}  // namespace stashy
