#include "login_command.hpp"
#include "../interactive/prompt.hpp"

namespace stashy::cli {

void LoginCommand::setup(CLI::App& app) {
    app.add_option("server_url", server_url_, "URL of your snippet server")
        ->required()
        ->type_name("<url>");

    app.add_option("-k,--key", api_key_, "API key (prompted for if omitted)")
        ->type_name("<key>");

    app.add_option("--key-name", key_name_,
                   "Name for a key created by password sign-in (default: stashy)")
        ->type_name("<name>");
}

std::optional<std::string> LoginCommand::key_from_password(CommandContext& ctx) {
    auto username = prompt_line("Username");
    if (!username || username->empty()) return std::nullopt;
    auto password = prompt_secret("Password");
    if (!password) return std::nullopt;

    auto key = ctx.session->exchange_password(server_url_, *username, *password, key_name_);
    if (!key.ok()) {
        report_error(key.error());
        return std::nullopt;
    }
    return key.value();
}

int LoginCommand::execute(CommandContext& ctx) {
    auto url = Session::normalize_server_url(server_url_);
    if (!url.ok()) {
        return report_error(url.error());
    }

    std::string key = api_key_;
    if (key.empty()) {
        auto entered = prompt_secret("API key (leave empty to sign in with username/password)");
        if (!entered) {
            std::cerr << "Cancelled.\n";
            return STASHY_EXIT_USER_ERROR;
        }
        key = *entered;
    }
    if (key.empty()) {
        auto minted = key_from_password(ctx);
        if (!minted) {
            std::cerr << "Login aborted.\n";
            return STASHY_EXIT_AUTH;
        }
        key = *minted;
    }

    auto result = ctx.session->login(url.value(), key);
    if (!result.ok()) {
        return report_error(result.error());
    }

    std::cout << "Logged in to " << ctx.session->config().server_url
              << ". API key saved to the system keyring.\n";
    return STASHY_EXIT_SUCCESS;
}

void LogoutCommand::setup(CLI::App& /* app */) {
    // No options for logout command
}

int LogoutCommand::execute(CommandContext& ctx) {
    if (ctx.session->config().server_url.empty()) {
        std::cout << "Not logged in.\n";
        return STASHY_EXIT_SUCCESS;
    }

    auto result = ctx.session->logout();
    if (!result.ok()) {
        return report_error(result.error());
    }
    std::cout << "Removed API key for " << ctx.session->config().server_url << "\n";
    return STASHY_EXIT_SUCCESS;
}

}  // namespace stashy::cli
