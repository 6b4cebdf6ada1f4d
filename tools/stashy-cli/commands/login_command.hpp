#pragma once

#include "command.hpp"
#include "exit_codes.hpp"

namespace stashy::cli {

/**
 * Store an API key for a server after checking it against the server.
 *
 * Without --key the key is prompted for; an empty answer switches to
 * username/password sign-in, which mints a new key.
 */
class LoginCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "login"; }
    std::string description() const override {
        return "Authenticate with your snippet server";
    }

private:
    std::string server_url_;
    std::string api_key_;
    std::string key_name_ = "stashy";

    std::optional<std::string> key_from_password(CommandContext& ctx);
};

class LogoutCommand : public Command {
public:
    void setup(CLI::App& app) override;
    int execute(CommandContext& ctx) override;

    std::string name() const override { return "logout"; }
    std::string description() const override {
        return "Forget the stored API key";
    }
};

}  // namespace stashy::cli
