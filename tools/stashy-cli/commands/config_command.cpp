#include "config_command.hpp"

namespace stashy::cli {

void ConfigCommand::setup(CLI::App& app) {
    app.add_option("--page-size", page_size_, "Default number of snippets per page")
        ->type_name("<num>")
        ->check(CLI::PositiveNumber);

    app.add_option("--timeout", timeout_seconds_, "Request timeout in seconds")
        ->type_name("<seconds>")
        ->check(CLI::PositiveNumber);
}

int ConfigCommand::execute(CommandContext& ctx) {
    const Config& current = ctx.session->config();

    if (page_size_ != 0 || timeout_seconds_ != 0) {
        uint32_t page_size = page_size_ != 0 ? page_size_ : current.default_page_size;
        int timeout = timeout_seconds_ != 0 ? timeout_seconds_ : current.timeout_seconds;
        auto result = ctx.session->update_preferences(page_size, timeout);
        if (!result.ok()) {
            return report_error(result.error());
        }
    }

    const Config& config = ctx.session->config();
    std::cout << "config file:  " << ctx.config_path.string() << "\n"
              << "server_url:   " << (config.server_url.empty() ? "(not set)" : config.server_url) << "\n"
              << "page_size:    " << config.default_page_size << "\n"
              << "timeout:      " << config.timeout_seconds << "s\n"
              << "logged in:    " << (ctx.session->is_authenticated() ? "yes" : "no") << "\n";
    return STASHY_EXIT_SUCCESS;
}

}  // namespace stashy::cli
