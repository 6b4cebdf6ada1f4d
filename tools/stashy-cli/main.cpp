#include <stashy/stashy.hpp>

#include "commands/command.hpp"
#include "commands/config_command.hpp"
#include "commands/create_command.hpp"
#include "commands/delete_command.hpp"
#include "commands/exit_codes.hpp"
#include "commands/get_command.hpp"
#include "commands/list_command.hpp"
#include "commands/login_command.hpp"
#include "commands/search_command.hpp"
#include "completion.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <memory>
#include <vector>

namespace {

using stashy::cli::Command;

std::vector<std::unique_ptr<Command>> make_commands() {
    std::vector<std::unique_ptr<Command>> commands;
    commands.push_back(std::make_unique<stashy::cli::LoginCommand>());
    commands.push_back(std::make_unique<stashy::cli::LogoutCommand>());
    commands.push_back(std::make_unique<stashy::cli::CreateCommand>());
    commands.push_back(std::make_unique<stashy::cli::ListCommand>());
    commands.push_back(std::make_unique<stashy::cli::GetCommand>());
    commands.push_back(std::make_unique<stashy::cli::UpdateCommand>());
    commands.push_back(std::make_unique<stashy::cli::DeleteCommand>());
    commands.push_back(std::make_unique<stashy::cli::SearchCommand>());
    commands.push_back(std::make_unique<stashy::cli::ConfigCommand>());
    return commands;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"stashy - keep your code snippets on a snippet server"};
    app.name("stashy");
    app.set_version_flag("--version", stashy::VERSION);
    app.require_subcommand(0, 1);

    bool verbose = false;
    std::string completions;
    app.add_flag("-v,--verbose", verbose, "Print debug output to stderr");
    app.add_option("--completions", completions, "Print a shell completion script")
        ->type_name("<shell>")
        ->check(CLI::IsMember({"bash", "zsh", "fish"}));

    auto commands = make_commands();
    std::vector<std::pair<CLI::App*, Command*>> registered;
    for (auto& cmd : commands) {
        CLI::App* sub = app.add_subcommand(cmd->name(), cmd->description());
        cmd->setup(*sub);
        registered.emplace_back(sub, cmd.get());
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? STASHY_EXIT_SUCCESS : STASHY_EXIT_USER_ERROR;
    }

    if (!completions.empty()) {
        auto script = stashy::cli::completion_script(completions);
        if (!script) {
            std::cerr << "Error: Unsupported shell: " << completions << "\n";
            return STASHY_EXIT_USER_ERROR;
        }
        std::cout << *script;
        return STASHY_EXIT_SUCCESS;
    }

    Command* selected = nullptr;
    for (auto& [sub, cmd] : registered) {
        if (sub->parsed()) {
            selected = cmd;
            break;
        }
    }
    if (!selected) {
        std::cerr << app.help();
        return STASHY_EXIT_USER_ERROR;
    }

    stashy::ConsoleLogger logger;
    logger.set_min_level(verbose ? stashy::LogLevel::DEBUG : stashy::LogLevel::WARNING);

    stashy::ConfigStore config_store = stashy::ConfigStore::at_default_location();
    stashy::SecretServiceVault vault(&logger);
    stashy::http::CurlTransport transport(stashy::USER_AGENT, &logger);
    stashy::Session session(config_store, vault, transport, &logger);

    // A broken config only blocks commands that need it; login rewrites it
    auto restored = session.restore();
    if (!restored.ok() && selected->name() != "login") {
        return stashy::cli::report_error(restored.error());
    }
    if (!restored.ok()) {
        logger.warning("Ignoring unreadable saved state: " + restored.error().to_string());
    }

    stashy::SnippetService service(session, &logger);

    stashy::cli::CommandContext ctx;
    ctx.session = &session;
    ctx.service = &service;
    ctx.logger = &logger;
    ctx.verbose = verbose;
    ctx.config_path = config_store.path();

    return selected->execute(ctx);
}
