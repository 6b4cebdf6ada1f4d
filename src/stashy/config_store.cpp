#include <stashy/config_store.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace stashy {

using json = nlohmann::json;

namespace {

constexpr const char* CONFIG_FILENAME = "config.json";
constexpr const char* APP_DIRNAME = "stashy";

const char* non_empty_env(const char* name) {
    const char* value = std::getenv(name);
    if (value && value[0] != '\0') return value;
    return nullptr;
}

}  // namespace

ConfigStore::ConfigStore(fs::path path) : path_(std::move(path)) {}

fs::path ConfigStore::default_directory() {
    if (const char* dir = non_empty_env("STASHY_CONFIG_DIR")) {
        return fs::path(dir);
    }
    if (const char* xdg = non_empty_env("XDG_CONFIG_HOME")) {
        return fs::path(xdg) / APP_DIRNAME;
    }
    if (const char* home = non_empty_env("HOME")) {
        return fs::path(home) / ".config" / APP_DIRNAME;
    }
    return fs::path(".") / APP_DIRNAME;
}

ConfigStore ConfigStore::at_default_location() {
    return ConfigStore(default_directory() / CONFIG_FILENAME);
}

Result<Config> ConfigStore::load() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        if (ec) {
            return Error(ErrorCode::CONFIG_ERROR,
                "Cannot access " + path_.string() + ": " + ec.message());
        }
        return Config{};
    }

    std::ifstream in(path_);
    if (!in) {
        return Error(ErrorCode::CONFIG_ERROR, "Cannot open " + path_.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    Config config;
    try {
        auto j = json::parse(ss.str());
        if (!j.is_object()) {
            return Error(ErrorCode::CONFIG_ERROR, path_.string() + ": expected a JSON object");
        }
        for (const auto& item : j.items()) {
            const std::string& key = item.key();
            const json& value = item.value();
            if (key == "server_url") {
                if (!value.is_string()) {
                    return Error(ErrorCode::CONFIG_ERROR, path_.string() + ": server_url must be a string");
                }
                config.server_url = value.get<std::string>();
            } else if (key == "default_page_size") {
                if (!value.is_number_unsigned() || value.get<uint64_t>() == 0 ||
                    value.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
                    return Error(ErrorCode::CONFIG_ERROR,
                        path_.string() + ": default_page_size must be a positive integer");
                }
                config.default_page_size = value.get<uint32_t>();
            } else if (key == "timeout_seconds") {
                if (!value.is_number_integer() || value.get<int64_t>() <= 0 ||
                    value.get<int64_t>() > MAX_TIMEOUT_SECONDS) {
                    return Error(ErrorCode::CONFIG_ERROR,
                        path_.string() + ": timeout_seconds must be between 1 and " +
                        std::to_string(MAX_TIMEOUT_SECONDS));
                }
                config.timeout_seconds = value.get<int>();
            } else {
                return Error(ErrorCode::CONFIG_ERROR,
                    path_.string() + ": unknown field '" + key + "'");
            }
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::CONFIG_ERROR,
            "Failed to parse " + path_.string() + ": " + e.what());
    }

    return config;
}

Result<void> ConfigStore::save(const Config& config) const {
    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Error(ErrorCode::CONFIG_ERROR,
                "Cannot create " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    json j;
    j["server_url"] = config.server_url;
    j["default_page_size"] = config.default_page_size;
    j["timeout_seconds"] = config.timeout_seconds;

    fs::path temp = path_;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Error(ErrorCode::CONFIG_ERROR, "Cannot write " + temp.string());
        }
        out << j.dump(2) << "\n";
        out.flush();
        if (!out) {
            return Error(ErrorCode::CONFIG_ERROR, "Write failed: " + temp.string());
        }
    }

    fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        fs::remove(temp, ec);
        return Error(ErrorCode::CONFIG_ERROR, "Cannot set permissions on " + temp.string());
    }

    fs::rename(temp, path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Error(ErrorCode::CONFIG_ERROR,
            "Cannot replace " + path_.string() + ": " + ec.message());
    }
    return Ok();
}

}  // namespace stashy
